#include "validator/validator.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

std::vector<std::string> RuleIds(const proto::ValidationResult& result) {
  std::vector<std::string> ids;
  for (const auto& finding : result.findings()) ids.push_back(finding.rule_id());
  return ids;
}

TEST(Validator, SafePython) {
  auto result = validator::Validate("print(\"hello\")\n", proto::PYTHON);
  EXPECT_TRUE(result.valid());
  EXPECT_EQ(result.risk_level(), proto::SAFE);
  EXPECT_EQ(result.risk_score(), 0);
  EXPECT_THAT(result.errors(), IsEmpty());
  EXPECT_THAT(result.warnings(), IsEmpty());
}

TEST(Validator, DestructiveShellCommand) {
  auto result = validator::Validate("import os\nos.system(\"rm -rf /\")\n",
                                    proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_EQ(result.risk_level(), proto::CRITICAL);
  EXPECT_THAT(RuleIds(result),
              ElementsAre("py-os-command", "py-os-module", "recursive-delete"));
  EXPECT_THAT(result.errors(),
              ElementsAre("System command (line 2): Running system commands "
                          "can compromise the host",
                          "Recursive deletion (line 2): Recursive deletion of "
                          "system paths is not allowed"));
  EXPECT_THAT(result.warnings(),
              ElementsAre("Operating system module (line 1): The module "
                          "exposes the host environment"));
  EXPECT_EQ(result.risk_score(), 90);
}

TEST(Validator, EmptyCode) {
  auto result = validator::Validate("  \n\t\n", proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(result.errors(), ElementsAre("Code cannot be empty"));
}

TEST(Validator, UnsupportedLanguage) {
  auto result = validator::Validate("print(1)", proto::INVALID_LANGUAGE);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(result.errors(),
              ElementsAre("Unsupported language: INVALID_LANGUAGE"));
}

TEST(Validator, UnbalancedBrackets) {
  auto result = validator::Validate("x = 1\nprint((x)\n", proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(result.errors(),
              ElementsAre("Syntax error (line 2): Unclosed brackets/parentheses"));
  result = validator::Validate("console.log(1];", proto::JAVASCRIPT);
  EXPECT_THAT(result.errors(),
              ElementsAre("Syntax error (line 1): Mismatched "
                          "brackets/parentheses"));
}

TEST(Validator, CommentsAndStringsAreNotCode) {
  auto result = validator::Validate(
      "# eval(x)\nprint('exec(y)')  # import subprocess\n", proto::PYTHON);
  EXPECT_TRUE(result.valid());
  EXPECT_THAT(result.findings(), IsEmpty());
}

TEST(Validator, ImportAliasesAreResolved) {
  auto result = validator::Validate("from os import system as run\nrun('ls')\n",
                                    proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(RuleIds(result), ElementsAre("py-os-command", "py-os-module"));
  EXPECT_EQ(result.findings(0).line(), 2);
}

TEST(Validator, InterpreterInternals) {
  auto result = validator::Validate(
      "().__class__.__bases__[0].__subclasses__()\n", proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(RuleIds(result), ElementsAre("py-interpreter-internals"));
  EXPECT_EQ(result.risk_level(), proto::HIGH);
}

TEST(Validator, InfiniteLoopIsAdvisory) {
  auto result = validator::Validate("while True:\n    x = 1\n", proto::PYTHON);
  EXPECT_TRUE(result.valid());
  EXPECT_EQ(result.risk_level(), proto::MEDIUM);
  EXPECT_THAT(result.warnings(),
              ElementsAre("Infinite loop (line 1): Loop condition is always "
                          "true and the loop never exits"));
  EXPECT_THAT(result.suggestions(),
              ElementsAre("Add a break condition or use a bounded loop"));
  EXPECT_FALSE(result.findings(0).blocking());

  result = validator::Validate("while True:\n    break\n", proto::PYTHON);
  EXPECT_THAT(result.findings(), IsEmpty());
}

TEST(Validator, CapabilitiesSkipRules) {
  const std::string code = "import socket\nf = open('data.txt')\n";
  auto result = validator::Validate(code, proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(RuleIds(result),
              ElementsAre("py-file-access", "py-network-module"));

  validator::ValidationOptions options;
  options.allow_filesystem = true;
  result = validator::Validate(code, proto::PYTHON, options);
  EXPECT_THAT(RuleIds(result), ElementsAre("py-network-module"));

  proto::ResourceLimits limits;
  limits.set_enable_network_access(true);
  limits.set_enable_file_system_access(true);
  result = validator::Validate(code, proto::PYTHON,
                               validator::ValidationOptions::FromLimits(limits));
  EXPECT_TRUE(result.valid());
  EXPECT_THAT(result.findings(), IsEmpty());
}

TEST(Validator, HardcodedSecretIsLowRisk) {
  auto result =
      validator::Validate("password = \"hunter22\"\nprint(1)\n", proto::PYTHON);
  EXPECT_TRUE(result.valid());
  EXPECT_EQ(result.risk_level(), proto::LOW);
  EXPECT_EQ(result.risk_score(), 5);
  EXPECT_THAT(result.suggestions(),
              ElementsAre("Remove sensitive data before execution"));
}

TEST(Validator, RiskScoreIsCapped) {
  auto result = validator::Validate(
      "eval('1')\nexec('2')\n__import__('os')\n", proto::PYTHON);
  EXPECT_EQ(result.findings_size(), 3);
  EXPECT_EQ(result.risk_score(), 100);
}

TEST(Validator, LongCodeSuggestion) {
  std::string code;
  for (int i = 0; i <= validator::kLongCodeLines; i++) code += "x = 1\n";
  auto result = validator::Validate(code, proto::PYTHON);
  EXPECT_TRUE(result.valid());
  EXPECT_THAT(result.suggestions(),
              ElementsAre("Consider breaking the code into smaller functions"));
}

TEST(Validator, Deterministic) {
  const std::string code =
      "import subprocess\nwhile True:\n    eval(input())\nrm -rf /\n";
  auto first = validator::Validate(code, proto::PYTHON);
  auto second = validator::Validate(code, proto::PYTHON);
  EXPECT_EQ(first.SerializeAsString(), second.SerializeAsString());
}

TEST(Validator, JavaScriptRules) {
  auto result = validator::Validate("console.log('hi');\n", proto::JAVASCRIPT);
  EXPECT_TRUE(result.valid());
  EXPECT_THAT(result.findings(), IsEmpty());

  result = validator::Validate("const x = eval('1 + 1');\n", proto::JAVASCRIPT);
  EXPECT_THAT(RuleIds(result), ElementsAre("js-eval"));

  result = validator::Validate("new Function('return 1')();\n",
                               proto::JAVASCRIPT);
  EXPECT_THAT(RuleIds(result), ElementsAre("js-function-constructor"));

  result = validator::Validate("const cp = require('node:child_process');\n",
                               proto::JAVASCRIPT);
  EXPECT_THAT(RuleIds(result), ElementsAre("js-process-module"));

  result = validator::Validate("process.exit(1);\n", proto::JAVASCRIPT);
  EXPECT_THAT(RuleIds(result), ElementsAre("js-process-object"));

  result = validator::Validate("``.constructor.constructor('x')();\n",
                               proto::JAVASCRIPT);
  EXPECT_THAT(RuleIds(result), ElementsAre("js-constructor-chain"));
  EXPECT_EQ(result.risk_level(), proto::CRITICAL);

  result = validator::Validate("setTimeout('alert(1)', 10);\n",
                               proto::JAVASCRIPT);
  EXPECT_THAT(RuleIds(result), ElementsAre("js-string-timer"));
}

TEST(Validator, JavaScriptNetwork) {
  const std::string code = "fetch('https://example.com');\n";
  auto result = validator::Validate(code, proto::JAVASCRIPT);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(result.errors(), ElementsAre(HasSubstr("Network access")));
  validator::ValidationOptions options;
  options.allow_network = true;
  EXPECT_TRUE(validator::Validate(code, proto::JAVASCRIPT, options).valid());
}

TEST(Validator, TemplateExpressionsAreChecked) {
  auto result =
      validator::Validate("const s = `${eval('1')}`;\n", proto::TYPESCRIPT);
  EXPECT_THAT(RuleIds(result), ElementsAre("js-eval"));
}

TEST(Validator, TypeScript) {
  auto result = validator::Validate(
      "const x: number = 1;\nfunction f(a: string): void {}\nconsole.log(x);\n",
      proto::TYPESCRIPT);
  EXPECT_TRUE(result.valid());
  EXPECT_THAT(result.findings(), IsEmpty());
}

TEST(Validator, FileMutationsOutsideOpen) {
  auto result = validator::Validate(
      "import os\nos.truncate('/tmp/data.txt', 0)\n"
      "os.replace('/tmp/data.txt', '/tmp/moved.txt')\n"
      "os.symlink('/etc', 'etc')\n",
      proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_THAT(result.errors(),
              Contains("File access (line 2): File system access is not "
                       "allowed in this environment"));
  EXPECT_THAT(result.errors(), Contains(HasSubstr("(line 3)")));
  EXPECT_THAT(result.errors(), Contains(HasSubstr("(line 4)")));

  validator::ValidationOptions options;
  options.allow_filesystem = true;
  EXPECT_TRUE(validator::Validate("import os\nos.truncate('data.txt', 0)\n",
                                  proto::PYTHON, options)
                  .valid());
}

TEST(Validator, PosixSpawnIsACommand) {
  auto result = validator::Validate(
      "import os\nos.posix_spawnp('sh', ['sh'], {})\n", proto::PYTHON);
  EXPECT_FALSE(result.valid());
  EXPECT_EQ(result.risk_level(), proto::CRITICAL);
  EXPECT_THAT(RuleIds(result), Contains("py-os-command"));
}

TEST(Validator, VeryLongLine) {
  std::string secret = "token = \"" + std::string(1 << 20, 'a') + "\"\n";
  auto result = validator::Validate(secret + "print(1)\n", proto::PYTHON);
  EXPECT_TRUE(result.valid());
  EXPECT_THAT(RuleIds(result), ElementsAre("hardcoded-secret"));
  EXPECT_EQ(result.findings(0).line(), 1);
  EXPECT_EQ(result.findings(0).column(), 1);

  result = validator::Validate(
      "const s = '" + std::string(1 << 20, 'b') + "';\nconsole.log(s);\n",
      proto::JAVASCRIPT);
  EXPECT_TRUE(result.valid());
  EXPECT_THAT(result.findings(), IsEmpty());
}

TEST(Validator, QuickCheck) {
  auto result = validator::QuickCheck("print(1)\n", proto::PYTHON);
  EXPECT_TRUE(result.safe);
  result = validator::QuickCheck("x = 1\n# rm -rf /\n", proto::PYTHON);
  EXPECT_FALSE(result.safe);
  EXPECT_THAT(result.critical_issues, ElementsAre("Recursive deletion (line 2)"));
  result = validator::QuickCheck("print(1)", proto::INVALID_LANGUAGE);
  EXPECT_FALSE(result.safe);
}

}  // namespace
