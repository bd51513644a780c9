#ifndef VALIDATOR_VALIDATOR_HPP
#define VALIDATOR_VALIDATOR_HPP

#include <string>
#include <vector>

#include "proto/execution.pb.h"

namespace validator {

// Capabilities granted to the code. Rules about granted capabilities are not
// checked.
struct ValidationOptions {
  bool allow_network = false;
  bool allow_filesystem = false;

  static ValidationOptions FromLimits(const proto::ResourceLimits& limits);
};

struct QuickCheckResult {
  bool safe = true;
  std::vector<std::string> critical_issues;
};

// Code longer than this gets a suggestion to split it.
const constexpr int kLongCodeLines = 100;

// Checks untrusted code against the rules of its language. Findings of high
// or critical severity block the execution, lower ones are reported as
// warnings. The output only depends on the input, and findings are in rule
// order, structural rules first.
proto::ValidationResult Validate(const std::string& code,
                                 proto::Language language,
                                 const ValidationOptions& options = {});

// Pattern-only scan for critical issues, much cheaper than Validate.
QuickCheckResult QuickCheck(const std::string& code, proto::Language language);

}  // namespace validator

#endif
