#include "validator/syntax_tree.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "validator/lexer.hpp"

namespace {

using ::testing::Contains;
using ::testing::Not;
using validator::NodeKind;

std::vector<std::string> Names(const validator::SyntaxTree& tree,
                               NodeKind kind) {
  std::vector<std::string> names;
  for (const auto& node : tree.nodes) {
    if (node.kind == kind) names.push_back(node.name);
  }
  return names;
}

std::vector<validator::SyntaxNode> Loops(const validator::SyntaxTree& tree) {
  std::vector<validator::SyntaxNode> loops;
  for (const auto& node : tree.nodes) {
    if (node.kind == NodeKind::LOOP) loops.push_back(node);
  }
  return loops;
}

TEST(Lexer, PythonStringsAndComments) {
  std::vector<validator::Token> tokens;
  std::string error;
  int line = 0;
  EXPECT_TRUE(validator::Tokenize("x = 'a#b'  # comment (\ny = \"\"\"(\n\"\"\"\n",
                                  validator::Syntax::PYTHON, &tokens, &error,
                                  &line));
  ASSERT_EQ(tokens.size(), 6u);
  EXPECT_EQ(tokens[2].type, validator::TokenType::STRING);
  EXPECT_EQ(tokens[2].text, "a#b");
  EXPECT_EQ(tokens[3].text, "y");
  EXPECT_EQ(tokens[3].line, 2);
  EXPECT_TRUE(tokens[3].first_on_line);
  EXPECT_EQ(tokens[5].text, "(\n");
}

TEST(Lexer, Indentation) {
  std::vector<validator::Token> tokens;
  EXPECT_TRUE(validator::Tokenize("if x:\n    y\n\tz\n", validator::Syntax::PYTHON,
                                  &tokens, nullptr, nullptr));
  ASSERT_EQ(tokens.size(), 5u);
  EXPECT_EQ(tokens[0].indent, 0);
  EXPECT_EQ(tokens[3].indent, 4);
  EXPECT_EQ(tokens[4].indent, 8);
}

TEST(Lexer, UnbalancedBrackets) {
  std::vector<validator::Token> tokens;
  std::string error;
  int line = 0;
  EXPECT_FALSE(validator::Tokenize("print(1]", validator::Syntax::PYTHON,
                                   &tokens, &error, &line));
  EXPECT_EQ(error, "Mismatched brackets/parentheses");
  EXPECT_EQ(line, 1);
  tokens.clear();
  EXPECT_FALSE(validator::Tokenize("f(\n[1,\n2]\n", validator::Syntax::PYTHON,
                                   &tokens, &error, &line));
  EXPECT_EQ(error, "Unclosed brackets/parentheses");
  EXPECT_EQ(line, 1);
}

TEST(Lexer, UnterminatedString) {
  std::vector<validator::Token> tokens;
  std::string error;
  int line = 0;
  EXPECT_FALSE(validator::Tokenize("x = 1\ns = 'abc\n",
                                   validator::Syntax::PYTHON, &tokens, &error,
                                   &line));
  EXPECT_EQ(error, "Unterminated string literal");
  EXPECT_EQ(line, 2);
}

TEST(Lexer, JavaScriptRegexAndTemplates) {
  std::vector<validator::Token> tokens;
  EXPECT_TRUE(validator::Tokenize("const r = /'[/]/g; const t = `a${b}c`;",
                                  validator::Syntax::JAVASCRIPT, &tokens,
                                  nullptr, nullptr));
  ASSERT_GE(tokens.size(), 4u);
  EXPECT_EQ(tokens[3].type, validator::TokenType::STRING);
  EXPECT_EQ(tokens[3].text, "'[/]");
  std::vector<std::string> texts;
  for (const auto& token : tokens) texts.push_back(token.text);
  EXPECT_THAT(texts, Contains("b"));
  EXPECT_THAT(texts, Contains("c"));
}

TEST(Lexer, DivisionIsNotRegex) {
  std::vector<validator::Token> tokens;
  EXPECT_TRUE(validator::Tokenize("const x = a / b / c;",
                                  validator::Syntax::JAVASCRIPT, &tokens,
                                  nullptr, nullptr));
  EXPECT_EQ(tokens.size(), 9u);
}

TEST(SyntaxTree, PythonImportsAndAliases) {
  auto tree = validator::Parse(
      "import numpy as np, os.path\n"
      "from subprocess import run as go\n"
      "np.array([1])\n"
      "go(['ls'])\n",
      proto::PYTHON);
  EXPECT_TRUE(tree.well_formed);
  EXPECT_THAT(Names(tree, NodeKind::IMPORT), Contains("numpy"));
  EXPECT_THAT(Names(tree, NodeKind::IMPORT), Contains("os.path"));
  EXPECT_THAT(Names(tree, NodeKind::IMPORT), Contains("subprocess"));
  EXPECT_THAT(Names(tree, NodeKind::CALL), Contains("numpy.array"));
  EXPECT_THAT(Names(tree, NodeKind::CALL), Contains("subprocess.run"));
}

TEST(SyntaxTree, PythonDefinitionsAreNotCalls) {
  auto tree = validator::Parse("def eval(x):\n    return x\n", proto::PYTHON);
  EXPECT_THAT(Names(tree, NodeKind::CALL), Not(Contains("eval")));
}

TEST(SyntaxTree, PythonAttributes) {
  auto tree = validator::Parse(
      "().__class__.__bases__[0].__subclasses__()\n"
      "getattr(x, '__globals__')\n",
      proto::PYTHON);
  auto attributes = Names(tree, NodeKind::ATTRIBUTE);
  EXPECT_THAT(attributes, Contains("__class__"));
  EXPECT_THAT(attributes, Contains("__subclasses__"));
  EXPECT_THAT(attributes, Contains("__globals__"));
}

TEST(SyntaxTree, PythonLoops) {
  auto tree = validator::Parse(
      "while True:\n"
      "    for i in range(3):\n"
      "        break\n"
      "while (1):\n"
      "    if x:\n"
      "        break\n"
      "while x < 3: x += 1\n"
      "while True: pass\n",
      proto::PYTHON);
  auto loops = Loops(tree);
  ASSERT_EQ(loops.size(), 4u);
  EXPECT_TRUE(loops[0].infinite);
  EXPECT_FALSE(loops[0].exits);
  EXPECT_EQ(loops[0].line, 1);
  EXPECT_TRUE(loops[1].infinite);
  EXPECT_TRUE(loops[1].exits);
  EXPECT_FALSE(loops[2].infinite);
  EXPECT_TRUE(loops[3].infinite);
  EXPECT_FALSE(loops[3].exits);
  EXPECT_EQ(loops[3].line, 8);
}

TEST(SyntaxTree, JavaScriptImports) {
  auto tree = validator::Parse(
      "const cp = require('child_process');\n"
      "import fs from 'node:fs';\n"
      "import {\n  get,\n} from \"https\";\n"
      "import('vm');\n"
      "import(name);\n"
      "export { x } from './x.js';\n",
      proto::JAVASCRIPT);
  EXPECT_TRUE(tree.well_formed);
  auto imports = Names(tree, NodeKind::IMPORT);
  EXPECT_THAT(imports, Contains("child_process"));
  EXPECT_THAT(imports, Contains("fs"));
  EXPECT_THAT(imports, Contains("https"));
  EXPECT_THAT(imports, Contains("vm"));
  EXPECT_THAT(imports, Contains("<dynamic>"));
  EXPECT_THAT(imports, Contains("./x.js"));
}

TEST(SyntaxTree, JavaScriptCallsAndConstructors) {
  auto tree = validator::Parse(
      "new Function('return 1')();\n"
      "const w = new WebSocket(url);\n"
      "window?.fetch('x');\n"
      "obj['__proto__'].x = 1;\n",
      proto::JAVASCRIPT);
  auto news = Names(tree, NodeKind::NEW);
  EXPECT_THAT(news, Contains("Function"));
  EXPECT_THAT(news, Contains("WebSocket"));
  auto calls = Names(tree, NodeKind::CALL);
  EXPECT_THAT(calls, Not(Contains("Function")));
  EXPECT_THAT(calls, Contains("window.fetch"));
  EXPECT_THAT(Names(tree, NodeKind::ATTRIBUTE), Contains("__proto__"));
}

TEST(SyntaxTree, JavaScriptLoops) {
  auto tree = validator::Parse(
      "while (true) { x++; }\n"
      "for (;;) { if (x) break; }\n"
      "do { for (;;) { break; } } while (true);\n"
      "for (let i = 0; i < 3; i++) {}\n"
      "while (true) { switch (x) { case 1: break; } }\n",
      proto::JAVASCRIPT);
  auto loops = Loops(tree);
  ASSERT_EQ(loops.size(), 6u);
  // while (true)
  EXPECT_TRUE(loops[0].infinite);
  EXPECT_FALSE(loops[0].exits);
  // for (;;) with break
  EXPECT_TRUE(loops[1].infinite);
  EXPECT_TRUE(loops[1].exits);
  // do ... while (true), the break belongs to the inner loop
  EXPECT_TRUE(loops[2].infinite);
  EXPECT_FALSE(loops[2].exits);
  EXPECT_EQ(loops[2].name, "do");
  EXPECT_TRUE(loops[3].infinite);
  EXPECT_TRUE(loops[3].exits);
  EXPECT_FALSE(loops[4].infinite);
  // while (true) around a switch
  EXPECT_TRUE(loops[5].infinite);
  EXPECT_FALSE(loops[5].exits);
}

}  // namespace
