#ifndef VALIDATOR_RULES_HPP
#define VALIDATOR_RULES_HPP

#include <memory>
#include <string>
#include <vector>

#include "proto/execution.pb.h"
#include "re2/re2.h"
#include "validator/syntax_tree.hpp"

namespace validator {

// A rule with a capability is only checked when the capability is not
// granted to the snippet.
enum class Capability { NONE, NETWORK, FILESYSTEM };

// A rule matching nodes of the syntax tree. A name matches a node name when
// they are equal, when the node name continues it with "." or "/", or when
// the rule name ends with "*" and is a prefix of the node name. Loop rules
// match loops that never exit.
struct StructuralRule {
  std::string id;
  std::string name;
  proto::RiskLevel severity;
  Capability capability;
  NodeKind kind;
  std::vector<std::string> names;
  std::string message;
  std::string suggestion;

  bool Matches(const SyntaxNode& node) const;
};

// A rule matching the raw source text, line by line. Patterns use the RE2
// syntax and match in time linear in the length of the line.
struct PatternRule {
  PatternRule(std::string id, std::string name, proto::RiskLevel severity,
              Capability capability, const std::string& pattern,
              std::string message, std::string suggestion,
              bool ignore_case = false);

  std::string id;
  std::string name;
  proto::RiskLevel severity;
  Capability capability;
  std::unique_ptr<re2::RE2> pattern;
  std::string message;
  std::string suggestion;
};

struct RuleSet {
  std::vector<StructuralRule> structural;
  std::vector<PatternRule> patterns;
};

// The rules for a language, in the order they are checked. Throws
// std::invalid_argument for unsupported languages.
const RuleSet& RulesFor(proto::Language language);

}  // namespace validator

#endif
