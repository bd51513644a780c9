#include "validator/lexer.hpp"

#include <ctype.h>

#include <unordered_set>

namespace validator {
namespace {

const constexpr int kTabWidth = 8;

bool IsIdentifierStart(char c, Syntax syntax) {
  unsigned char u = c;
  return isalpha(u) || c == '_' || u >= 0x80 ||
         (syntax == Syntax::JAVASCRIPT && c == '$');
}

bool IsIdentifierChar(char c, Syntax syntax) {
  return IsIdentifierStart(c, syntax) || isdigit(static_cast<unsigned char>(c));
}

bool IsStringPrefix(const std::string& ident) {
  if (ident.size() > 2) return false;
  for (char c : ident) {
    if (std::string("rRbBuUfF").find(c) == std::string::npos) return false;
  }
  return true;
}

// Keywords after which a slash starts a regular expression literal.
bool KeywordBeforeExpression(const std::string& word) {
  static const std::unordered_set<std::string> kKeywords = {
      "return", "typeof", "case",  "do",    "else",  "in",    "instanceof",
      "new",    "delete", "void",  "throw", "yield", "await", "of"};
  return kKeywords.count(word) > 0;
}

class Lexer {
 public:
  Lexer(const std::string& code, Syntax syntax)
      : code_(code), syntax_(syntax) {}

  bool Run(std::vector<Token>* tokens, std::string* error_msg,
           int* error_line) {
    tokens_ = tokens;
    while (pos_ < code_.size()) {
      if (!Step()) break;
    }
    if (error_.empty() && !brackets_.empty()) {
      if (brackets_.back().template_expression) {
        Fail("Unterminated template literal", brackets_.back().line);
      } else {
        Fail("Unclosed brackets/parentheses", brackets_.back().line);
      }
    }
    if (!error_.empty()) {
      if (error_msg) *error_msg = error_;
      if (error_line) *error_line = error_line_;
      return false;
    }
    return true;
  }

 private:
  struct Bracket {
    char open;
    int line;
    bool template_expression;
  };

  char Peek(size_t offset = 0) const {
    return pos_ + offset < code_.size() ? code_[pos_ + offset] : '\0';
  }

  void Advance() {
    if (code_[pos_] == '\n') {
      line_++;
      column_ = 1;
      indent_ = 0;
      at_line_start_ = true;
    } else {
      column_++;
    }
    pos_++;
  }

  void Fail(const std::string& message, int line) {
    if (!error_.empty()) return;
    error_ = message;
    error_line_ = line;
  }

  void Emit(TokenType type, std::string text, int line, int column) {
    Token token;
    token.type = type;
    token.text = std::move(text);
    token.line = line;
    token.column = column;
    token.indent = token_indent_;
    token.first_on_line = token_first_on_line_;
    token_first_on_line_ = false;
    tokens_->push_back(std::move(token));
  }

  bool RegexAllowed() const {
    if (tokens_->empty()) return true;
    const Token& prev = tokens_->back();
    switch (prev.type) {
      case TokenType::IDENTIFIER:
        return KeywordBeforeExpression(prev.text);
      case TokenType::NUMBER:
      case TokenType::STRING:
        return false;
      case TokenType::PUNCTUATION:
        return prev.text != ")" && prev.text != "]" && prev.text != "}";
    }
    return true;
  }

  // Returns false when lexing cannot go on.
  bool Step() {
    char c = Peek();
    if (c == '\n') {
      Advance();
      return true;
    }
    if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
      if (at_line_start_) {
        indent_ = c == '\t' ? (indent_ / kTabWidth + 1) * kTabWidth
                            : indent_ + 1;
      }
      Advance();
      return true;
    }
    if (c == '\\' && Peek(1) == '\n') {
      Advance();
      Advance();
      at_line_start_ = false;
      return true;
    }
    if (at_line_start_) {
      at_line_start_ = false;
      token_first_on_line_ = true;
      token_indent_ = indent_;
    }
    if (syntax_ == Syntax::PYTHON && c == '#') {
      SkipLine();
      return true;
    }
    if (syntax_ == Syntax::JAVASCRIPT && c == '/' && Peek(1) == '/') {
      SkipLine();
      return true;
    }
    if (syntax_ == Syntax::JAVASCRIPT && c == '/' && Peek(1) == '*') {
      return SkipBlockComment();
    }
    if (IsIdentifierStart(c, syntax_)) return Identifier();
    if (isdigit(static_cast<unsigned char>(c)) ||
        (c == '.' && isdigit(static_cast<unsigned char>(Peek(1))))) {
      return Number();
    }
    if (c == '"' || c == '\'') return String(line_, column_);
    if (syntax_ == Syntax::JAVASCRIPT && c == '`') {
      int line = line_, column = column_;
      Advance();
      return Template(line, column);
    }
    if (syntax_ == Syntax::JAVASCRIPT && c == '/' && RegexAllowed()) {
      return Regex();
    }
    return Punctuation();
  }

  void SkipLine() {
    while (pos_ < code_.size() && Peek() != '\n') Advance();
  }

  bool SkipBlockComment() {
    int line = line_;
    Advance();
    Advance();
    while (pos_ < code_.size()) {
      if (Peek() == '*' && Peek(1) == '/') {
        Advance();
        Advance();
        return true;
      }
      Advance();
    }
    Fail("Unterminated comment", line);
    return false;
  }

  bool Identifier() {
    int line = line_, column = column_;
    size_t start = pos_;
    while (pos_ < code_.size() && IsIdentifierChar(Peek(), syntax_)) Advance();
    std::string text = code_.substr(start, pos_ - start);
    if (syntax_ == Syntax::PYTHON && (Peek() == '"' || Peek() == '\'') &&
        IsStringPrefix(text)) {
      return String(line, column);
    }
    Emit(TokenType::IDENTIFIER, std::move(text), line, column);
    return true;
  }

  bool Number() {
    int line = line_, column = column_;
    size_t start = pos_;
    while (pos_ < code_.size()) {
      char c = Peek();
      if (isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
        Advance();
      } else if ((c == '+' || c == '-') && pos_ > start &&
                 (code_[pos_ - 1] == 'e' || code_[pos_ - 1] == 'E') &&
                 !(code_[start] == '0' && pos_ > start + 1 &&
                   (code_[start + 1] == 'x' || code_[start + 1] == 'X'))) {
        Advance();
      } else {
        break;
      }
    }
    Emit(TokenType::NUMBER, code_.substr(start, pos_ - start), line, column);
    return true;
  }

  bool String(int line, int column) {
    char quote = Peek();
    bool triple = syntax_ == Syntax::PYTHON && Peek(1) == quote &&
                  Peek(2) == quote;
    for (int i = 0; i < (triple ? 3 : 1); i++) Advance();
    std::string text;
    while (pos_ < code_.size()) {
      char c = Peek();
      if (c == '\\') {
        text += c;
        Advance();
        if (pos_ < code_.size()) {
          text += Peek();
          Advance();
        }
        continue;
      }
      if (c == quote) {
        if (!triple) {
          Advance();
          Emit(TokenType::STRING, std::move(text), line, column);
          return true;
        }
        if (Peek(1) == quote && Peek(2) == quote) {
          Advance();
          Advance();
          Advance();
          Emit(TokenType::STRING, std::move(text), line, column);
          return true;
        }
      }
      if (c == '\n' && !triple) break;
      text += c;
      Advance();
    }
    Fail("Unterminated string literal", line);
    return false;
  }

  // Reads a template literal up to its end or to the start of an embedded
  // expression. The opening backtick (or the closing brace of the previous
  // expression) has already been consumed.
  bool Template(int line, int column) {
    std::string text;
    while (pos_ < code_.size()) {
      char c = Peek();
      if (c == '\\') {
        text += c;
        Advance();
        if (pos_ < code_.size()) {
          text += Peek();
          Advance();
        }
        continue;
      }
      if (c == '`') {
        Advance();
        Emit(TokenType::STRING, std::move(text), line, column);
        return true;
      }
      if (c == '$' && Peek(1) == '{') {
        Emit(TokenType::STRING, std::move(text), line, column);
        brackets_.push_back({'{', line_, true});
        Advance();
        Advance();
        return true;
      }
      text += c;
      Advance();
    }
    Fail("Unterminated template literal", line);
    return false;
  }

  bool Regex() {
    int line = line_, column = column_;
    Advance();
    std::string text;
    bool in_class = false;
    while (pos_ < code_.size() && Peek() != '\n') {
      char c = Peek();
      if (c == '\\') {
        text += c;
        Advance();
        if (pos_ < code_.size() && Peek() != '\n') {
          text += Peek();
          Advance();
        }
        continue;
      }
      if (c == '[') in_class = true;
      if (c == ']') in_class = false;
      if (c == '/' && !in_class) {
        Advance();
        while (pos_ < code_.size() && IsIdentifierChar(Peek(), syntax_)) {
          Advance();
        }
        Emit(TokenType::STRING, std::move(text), line, column);
        return true;
      }
      text += c;
      Advance();
    }
    Fail("Unterminated regular expression literal", line);
    return false;
  }

  bool Punctuation() {
    int line = line_, column = column_;
    char c = Peek();
    if (c == '?' && Peek(1) == '.' &&
        !isdigit(static_cast<unsigned char>(Peek(2)))) {
      Advance();
      Advance();
      Emit(TokenType::PUNCTUATION, "?.", line, column);
      return true;
    }
    if (c == '.' && Peek(1) == '.' && Peek(2) == '.') {
      Advance();
      Advance();
      Advance();
      Emit(TokenType::PUNCTUATION, "...", line, column);
      return true;
    }
    if (c == '=' && Peek(1) == '>') {
      Advance();
      Advance();
      Emit(TokenType::PUNCTUATION, "=>", line, column);
      return true;
    }
    Advance();
    if (c == '(' || c == '[' || c == '{') {
      brackets_.push_back({c, line, false});
    } else if (c == ')' || c == ']' || c == '}') {
      char expected = c == ')' ? '(' : c == ']' ? '[' : '{';
      if (brackets_.empty() || brackets_.back().open != expected) {
        Fail("Mismatched brackets/parentheses", line);
        return false;
      }
      bool template_expression = brackets_.back().template_expression;
      brackets_.pop_back();
      if (template_expression) return Template(line, column);
    }
    Emit(TokenType::PUNCTUATION, std::string(1, c), line, column);
    return true;
  }

  const std::string& code_;
  Syntax syntax_;
  std::vector<Token>* tokens_ = nullptr;
  std::vector<Bracket> brackets_;
  size_t pos_ = 0;
  int line_ = 1;
  int column_ = 1;
  int indent_ = 0;
  bool at_line_start_ = true;
  int token_indent_ = 0;
  bool token_first_on_line_ = false;
  std::string error_;
  int error_line_ = 0;
};

}  // namespace

bool Tokenize(const std::string& code, Syntax syntax,
              std::vector<Token>* tokens, std::string* error_msg,
              int* error_line) {
  Lexer lexer(code, syntax);
  return lexer.Run(tokens, error_msg, error_line);
}

}  // namespace validator
