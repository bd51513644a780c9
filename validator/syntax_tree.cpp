#include "validator/syntax_tree.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <unordered_set>
#include <utility>

#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "validator/lexer.hpp"

namespace validator {
namespace {

using Tokens = std::vector<Token>;

bool IsNonZeroNumber(const Token& token) {
  return token.type == TokenType::NUMBER &&
         token.text.find_first_of("123456789") != std::string::npos;
}

bool IsDunder(const std::string& s) {
  return s.size() > 4 && absl::StartsWith(s, "__") && absl::EndsWith(s, "__");
}

class Parser {
 public:
  Parser(const Tokens& tokens, SyntaxTree* tree)
      : t_(tokens), tree_(tree) {}
  virtual ~Parser() = default;
  virtual void Run() = 0;

 protected:
  // A component of a dotted name and the index of its token.
  using Part = std::pair<std::string, size_t>;

  struct Range {
    size_t begin;
    size_t end;
    // First token after the statement.
    size_t next;
  };

  bool IsPunct(size_t i, const char* text) const {
    return i < t_.size() && t_[i].type == TokenType::PUNCTUATION &&
           t_[i].text == text;
  }
  bool IsIdent(size_t i) const {
    return i < t_.size() && t_[i].type == TokenType::IDENTIFIER;
  }
  bool IsIdent(size_t i, const char* text) const {
    return IsIdent(i) && t_[i].text == text;
  }
  bool IsString(size_t i) const {
    return i < t_.size() && t_[i].type == TokenType::STRING;
  }
  bool IsDot(size_t i) const { return IsPunct(i, ".") || IsPunct(i, "?."); }
  bool IsMember(size_t i) const { return i > 0 && IsDot(i - 1); }

  // Index of the bracket closing the one at open, or the number of tokens.
  size_t MatchingClose(size_t open) const {
    int depth = 0;
    for (size_t i = open; i < t_.size(); i++) {
      if (t_[i].type != TokenType::PUNCTUATION) continue;
      const std::string& s = t_[i].text;
      if (s == "(" || s == "[" || s == "{") {
        depth++;
      } else if (s == ")" || s == "]" || s == "}") {
        if (--depth == 0) return i;
      }
    }
    return t_.size();
  }

  // Whether the tokens in [begin, end) form an always true condition.
  bool IsAlwaysTrue(size_t begin, size_t end) const {
    while (end - begin >= 2 && IsPunct(begin, "(") &&
           MatchingClose(begin) == end - 1) {
      begin++;
      end--;
    }
    if (end - begin == 1) {
      return IsIdent(begin, "True") || IsIdent(begin, "true") ||
             IsNonZeroNumber(t_[begin]);
    }
    return end - begin == 2 && IsPunct(begin, "!") &&
           t_[begin + 1].type == TokenType::NUMBER &&
           !IsNonZeroNumber(t_[begin + 1]);
  }

  void Add(NodeKind kind, std::string name, const Token& at) {
    SyntaxNode node;
    node.kind = kind;
    node.name = std::move(name);
    node.line = at.line;
    node.column = at.column;
    tree_->nodes.push_back(std::move(node));
  }

  void AddLoop(const Token& at, bool infinite, bool exits) {
    Add(NodeKind::LOOP, at.text, at);
    tree_->nodes.back().infinite = infinite;
    tree_->nodes.back().exits = exits;
  }

  // Reads a dotted name starting at i, and returns the index past it.
  size_t Chain(size_t i, std::vector<Part>* parts, bool computed) const {
    parts->emplace_back(t_[i].text, i);
    size_t j = i + 1;
    while (true) {
      if (IsDot(j) && IsIdent(j + 1)) {
        parts->emplace_back(t_[j + 1].text, j + 1);
        j += 2;
      } else if (computed && IsPunct(j, "[") && IsString(j + 1) &&
                 IsPunct(j + 2, "]")) {
        parts->emplace_back(t_[j + 1].text, j + 1);
        j += 3;
      } else {
        return j;
      }
    }
  }

  static std::string Join(const std::vector<Part>& parts) {
    return absl::StrJoin(parts, ".",
                         [](std::string* out, const Part& part) {
                           out->append(part.first);
                         });
  }

  std::string Resolve(std::vector<Part> parts) const {
    auto alias = aliases_.find(parts[0].first);
    if (alias != aliases_.end()) parts[0].first = alias->second;
    return Join(parts);
  }

  // Records a name, the members accessed through it and, when the chain is
  // followed by an argument list and calls are wanted, the call.
  size_t Reference(size_t i, bool computed, bool calls = true) {
    std::vector<Part> parts;
    size_t end = Chain(i, &parts, computed);
    Add(NodeKind::NAME, parts[0].first, t_[i]);
    for (size_t k = 1; k < parts.size(); k++) {
      Add(NodeKind::ATTRIBUTE, parts[k].first, t_[parts[k].second]);
    }
    if (calls && IsPunct(end, "(")) {
      Add(NodeKind::CALL, Resolve(parts), t_[i]);
    }
    return end;
  }

  const Tokens& t_;
  SyntaxTree* tree_;
  std::map<std::string, std::string> aliases_;
};

class PythonParser : public Parser {
 public:
  using Parser::Parser;

  void Run() override {
    static const std::unordered_set<std::string> kKeywords = {
        "and",    "as",     "assert", "async",    "await",  "break",
        "class",  "continue", "def",  "del",      "elif",   "else",
        "except", "finally", "for",   "from",     "global", "if",
        "import", "in",     "is",     "lambda",   "nonlocal", "not",
        "or",     "pass",   "raise",  "return",   "try",    "while",
        "with",   "yield",  "True",   "False",    "None"};
    size_t i = 0;
    while (i < t_.size()) {
      const Token& token = t_[i];
      if (token.type == TokenType::STRING) {
        if (IsDunder(token.text)) Add(NodeKind::ATTRIBUTE, token.text, token);
        i++;
        continue;
      }
      if (token.type != TokenType::IDENTIFIER) {
        i++;
        continue;
      }
      if (IsMember(i)) {
        Add(NodeKind::ATTRIBUTE, token.text, token);
        if (IsPunct(i + 1, "(")) Add(NodeKind::CALL, token.text, token);
        i++;
      } else if (token.text == "import") {
        i = Import(i);
      } else if (token.text == "from") {
        i = FromImport(i);
      } else if (token.text == "while") {
        Loop(i);
        i++;
      } else if (token.text == "def" || token.text == "class") {
        i += IsIdent(i + 1) ? 2 : 1;
      } else if (kKeywords.count(token.text)) {
        i++;
      } else {
        i = Reference(i, false);
      }
    }
  }

 private:
  size_t Import(size_t i) {
    size_t j = i + 1;
    while (IsIdent(j)) {
      std::vector<Part> parts;
      size_t end = Chain(j, &parts, false);
      std::string module = Join(parts);
      Add(NodeKind::IMPORT, module, t_[j]);
      if (IsIdent(end, "as") && IsIdent(end + 1)) {
        aliases_[t_[end + 1].text] = module;
        end += 2;
      }
      if (!IsPunct(end, ",")) return end;
      j = end + 1;
    }
    return j;
  }

  size_t FromImport(size_t i) {
    size_t j = i + 1;
    std::string module;
    while (IsPunct(j, ".") || IsPunct(j, "...")) module += t_[j++].text;
    if (IsIdent(j) && t_[j].text != "import") {
      std::vector<Part> parts;
      j = Chain(j, &parts, false);
      module += Join(parts);
    }
    if (module.empty() || !IsIdent(j, "import")) return i + 1;
    Add(NodeKind::IMPORT, module, t_[i]);
    j++;
    bool parenthesized = IsPunct(j, "(");
    if (parenthesized) j++;
    while (IsIdent(j)) {
      std::string name = t_[j].text;
      std::string local = name;
      j++;
      if (IsIdent(j, "as") && IsIdent(j + 1)) {
        local = t_[j + 1].text;
        j += 2;
      }
      if (module[0] != '.') aliases_[local] = module + "." + name;
      if (!IsPunct(j, ",")) break;
      j++;
    }
    if (parenthesized && IsPunct(j, ")")) j++;
    return j;
  }

  void Loop(size_t i) {
    size_t colon = i + 1;
    int depth = 0;
    for (; colon < t_.size(); colon++) {
      if (t_[colon].type != TokenType::PUNCTUATION) continue;
      const std::string& s = t_[colon].text;
      if (s == "(" || s == "[" || s == "{") depth++;
      if (s == ")" || s == "]" || s == "}") depth--;
      if (depth == 0 && s == ":") break;
    }
    if (colon >= t_.size()) return;
    size_t begin = colon + 1;
    size_t end = begin;
    if (begin < t_.size() && t_[begin].line == t_[colon].line) {
      while (end < t_.size() && t_[end].line == t_[colon].line) end++;
    } else {
      while (end < t_.size() &&
             !(t_[end].first_on_line && t_[end].indent <= t_[i].indent)) {
        end++;
      }
    }
    AddLoop(t_[i], IsAlwaysTrue(i + 1, colon), BodyExits(begin, end));
  }

  bool BodyExits(size_t begin, size_t end) const {
    // Indentation of the loops nested in the body; their breaks do not exit.
    std::vector<int> nested;
    for (size_t k = begin; k < end; k++) {
      const Token& token = t_[k];
      if (token.first_on_line) {
        while (!nested.empty() && token.indent <= nested.back()) {
          nested.pop_back();
        }
      }
      if (token.type != TokenType::IDENTIFIER) continue;
      if (token.text == "return" || token.text == "raise") return true;
      if (token.text == "break" && nested.empty()) return true;
      if ((token.text == "exit" || token.text == "quit" ||
           token.text == "_exit") &&
          IsPunct(k + 1, "(")) {
        return true;
      }
      if (token.text == "while" || token.text == "for") {
        nested.push_back(token.indent);
      }
    }
    return false;
  }
};

class JavaScriptParser : public Parser {
 public:
  using Parser::Parser;

  void Run() override {
    static const std::unordered_set<std::string> kKeywords = {
        "break",  "case",   "catch",  "const",      "continue", "debugger",
        "default", "delete", "else",  "extends",    "finally",  "if",
        "in",     "instanceof", "let", "return",    "super",    "switch",
        "this",   "throw",  "try",    "typeof",     "var",      "void",
        "with",   "yield",  "async",  "await",      "of",       "true",
        "false",  "null",   "undefined"};
    size_t i = 0;
    while (i < t_.size()) {
      const Token& token = t_[i];
      if (token.type == TokenType::STRING) {
        if (i > 0 && IsPunct(i - 1, "[") && IsPunct(i + 1, "]")) {
          Add(NodeKind::ATTRIBUTE, token.text, token);
        }
        i++;
        continue;
      }
      if (token.type != TokenType::IDENTIFIER) {
        i++;
        continue;
      }
      if (IsMember(i)) {
        Add(NodeKind::ATTRIBUTE, token.text, token);
        if (IsPunct(i + 1, "(")) Add(NodeKind::CALL, token.text, token);
        i++;
      } else if (token.text == "require" && IsPunct(i + 1, "(") &&
                 IsString(i + 2) && IsPunct(i + 3, ")")) {
        Add(NodeKind::IMPORT, Module(t_[i + 2].text), token);
        i += 4;
      } else if (token.text == "import") {
        if (IsPunct(i + 1, "(")) {
          bool literal = IsString(i + 2) && IsPunct(i + 3, ")");
          Add(NodeKind::IMPORT,
              literal ? Module(t_[i + 2].text) : "<dynamic>", token);
        } else if (IsString(i + 1)) {
          Add(NodeKind::IMPORT, Module(t_[i + 1].text), token);
        } else if (!IsDot(i + 1)) {
          ImportFrom(i);
        }
        i++;
      } else if (token.text == "export") {
        ImportFrom(i);
        i++;
      } else if (token.text == "while" || token.text == "for") {
        if (!do_tails_.count(i)) Loop(i);
        i++;
      } else if (token.text == "do") {
        DoLoop(i);
        i++;
      } else if (token.text == "function" || token.text == "class") {
        i += IsIdent(i + 1) ? 2 : 1;
      } else if (token.text == "new") {
        if (IsIdent(i + 1)) {
          std::vector<Part> parts;
          Chain(i + 1, &parts, true);
          Add(NodeKind::NEW, Resolve(parts), token);
          i = Reference(i + 1, true, false);
        } else {
          i++;
        }
      } else if (kKeywords.count(token.text)) {
        i++;
      } else {
        i = Reference(i, true);
      }
    }
  }

 private:
  static std::string Module(const std::string& specifier) {
    if (absl::StartsWith(specifier, "node:")) return specifier.substr(5);
    return specifier;
  }

  // Finds the module of an "import ... from" or "export ... from" statement.
  void ImportFrom(size_t i) {
    int depth = 0;
    for (size_t j = i + 1; j < t_.size(); j++) {
      if (depth == 0 && IsPunct(j, ";")) return;
      if (IsIdent(j, "from") && IsString(j + 1)) {
        Add(NodeKind::IMPORT, Module(t_[j + 1].text), t_[j + 1]);
        return;
      }
      if (IsPunct(j, "{") || IsPunct(j, "(")) depth++;
      if (IsPunct(j, "}") || IsPunct(j, ")")) {
        if (--depth < 0) return;
      }
      if (depth == 0 && t_[j].first_on_line && !IsPunct(j - 1, ",") &&
          !IsPunct(j - 1, "{") && !IsIdent(j - 1, "import") &&
          !IsIdent(j - 1, "export") && !IsIdent(j, "from")) {
        return;
      }
    }
  }

  Range Statement(size_t start) const {
    if (IsPunct(start, "{")) {
      size_t close = MatchingClose(start);
      return {start + 1, close, std::min(close + 1, t_.size())};
    }
    int depth = 0;
    size_t j = start;
    for (; j < t_.size(); j++) {
      if (IsPunct(j, "(") || IsPunct(j, "[") || IsPunct(j, "{")) depth++;
      if (IsPunct(j, ")") || IsPunct(j, "]") || IsPunct(j, "}")) depth--;
      if (depth == 0 && IsPunct(j, ";")) break;
    }
    size_t next = std::min(j + 1, t_.size());
    return {start, next, next};
  }

  void Loop(size_t i) {
    if (!IsPunct(i + 1, "(")) return;
    size_t close = MatchingClose(i + 1);
    if (close >= t_.size()) return;
    bool infinite;
    if (t_[i].text == "while") {
      infinite = IsAlwaysTrue(i + 2, close);
    } else {
      infinite = close == i + 4 && IsPunct(i + 2, ";") && IsPunct(i + 3, ";");
    }
    Range body = Statement(close + 1);
    AddLoop(t_[i], infinite, BodyExits(body.begin, body.end, true));
  }

  void DoLoop(size_t i) {
    Range body = Statement(i + 1);
    size_t tail = body.next;
    if (!IsIdent(tail, "while") || !IsPunct(tail + 1, "(")) return;
    size_t close = MatchingClose(tail + 1);
    if (close >= t_.size()) return;
    do_tails_.insert(tail);
    AddLoop(t_[i], IsAlwaysTrue(tail + 2, close),
            BodyExits(body.begin, body.end, true));
  }

  bool BodyExits(size_t begin, size_t end, bool breaks) const {
    for (size_t k = begin; k < end && k < t_.size(); k++) {
      const Token& token = t_[k];
      if (token.type != TokenType::IDENTIFIER) continue;
      if (IsMember(k)) {
        if (token.text == "exit" && IsIdent(k - 2, "process")) return true;
        continue;
      }
      if (token.text == "return" || token.text == "throw") return true;
      if (token.text == "break" && breaks) return true;
      if ((token.text == "while" || token.text == "for" ||
           token.text == "switch") &&
          IsPunct(k + 1, "(")) {
        size_t close = MatchingClose(k + 1);
        Range body = Statement(close + 1);
        if (BodyExits(body.begin, body.end, false)) return true;
        k = body.next - 1;
      } else if (token.text == "do") {
        Range body = Statement(k + 1);
        if (BodyExits(body.begin, body.end, false)) return true;
        k = body.next - 1;
        if (IsIdent(body.next, "while") && IsPunct(body.next + 1, "(")) {
          k = MatchingClose(body.next + 1);
        }
      }
    }
    return false;
  }

  std::set<size_t> do_tails_;
};

}  // namespace

SyntaxTree Parse(const std::string& code, proto::Language language) {
  SyntaxTree tree;
  Syntax syntax = language == proto::Language::PYTHON ? Syntax::PYTHON
                                                      : Syntax::JAVASCRIPT;
  std::vector<Token> tokens;
  tree.well_formed =
      Tokenize(code, syntax, &tokens, &tree.error, &tree.error_line);
  if (syntax == Syntax::PYTHON) {
    PythonParser(tokens, &tree).Run();
  } else {
    JavaScriptParser(tokens, &tree).Run();
  }
  return tree;
}

}  // namespace validator
