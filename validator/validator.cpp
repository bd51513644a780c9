#include "validator/validator.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "validator/rules.hpp"
#include "validator/syntax_tree.hpp"

namespace validator {
namespace {

using proto::RiskLevel;

struct Hit {
  std::string name;
  std::string suggestion;
  proto::Finding finding;
};

bool IsSupported(proto::Language language) {
  return language == proto::Language::PYTHON ||
         language == proto::Language::JAVASCRIPT ||
         language == proto::Language::TYPESCRIPT;
}

bool Granted(Capability capability, const ValidationOptions& options) {
  switch (capability) {
    case Capability::NETWORK:
      return options.allow_network;
    case Capability::FILESYSTEM:
      return options.allow_filesystem;
    case Capability::NONE:
      return false;
  }
  return false;
}

int Weight(RiskLevel severity) {
  switch (severity) {
    case RiskLevel::CRITICAL:
      return 40;
    case RiskLevel::HIGH:
      return 25;
    case RiskLevel::MEDIUM:
      return 10;
    case RiskLevel::LOW:
      return 5;
    default:
      return 0;
  }
}

class Collector {
 public:
  void Add(const std::string& rule_id, const std::string& name,
           RiskLevel severity, int line, int column,
           const std::string& message, const std::string& suggestion) {
    if (!seen_.emplace(rule_id, line).second) return;
    Hit hit;
    hit.name = name;
    hit.suggestion = suggestion;
    hit.finding.set_rule_id(rule_id);
    hit.finding.set_severity(severity);
    hit.finding.set_line(line);
    hit.finding.set_column(column);
    hit.finding.set_message(message);
    hit.finding.set_blocking(severity >= RiskLevel::HIGH);
    hits_.push_back(std::move(hit));
  }

  proto::ValidationResult Summarize(int num_lines) const {
    proto::ValidationResult result;
    RiskLevel risk = RiskLevel::SAFE;
    int score = 0;
    std::set<std::string> suggestions;
    for (const Hit& hit : hits_) {
      const proto::Finding& finding = hit.finding;
      std::string diagnostic =
          finding.line() > 0
              ? absl::StrCat(hit.name, " (line ", finding.line(),
                             "): ", finding.message())
              : finding.message();
      if (finding.blocking()) {
        result.add_errors(diagnostic);
      } else {
        result.add_warnings(diagnostic);
      }
      if (!hit.suggestion.empty() && suggestions.insert(hit.suggestion).second) {
        result.add_suggestions(hit.suggestion);
      }
      risk = std::max(risk, finding.severity());
      score += Weight(finding.severity());
      *result.add_findings() = finding;
    }
    if (num_lines > kLongCodeLines) {
      result.add_suggestions("Consider breaking the code into smaller functions");
    }
    result.set_valid(result.errors_size() == 0);
    result.set_risk_level(risk);
    result.set_risk_score(std::min(score, 100));
    return result;
  }

 private:
  std::vector<Hit> hits_;
  std::set<std::pair<std::string, int>> seen_;
};

// Calls fn(line, column) for every match of the rule, in order.
template <typename F>
void ForEachMatch(const PatternRule& rule,
                  const std::vector<std::string>& lines, F fn) {
  for (size_t i = 0; i < lines.size(); i++) {
    re2::StringPiece text(lines[i]);
    re2::StringPiece match;
    size_t pos = 0;
    while (pos <= text.size() &&
           rule.pattern->Match(text, pos, text.size(), re2::RE2::UNANCHORED,
                               &match, 1)) {
      size_t start = match.data() - text.data();
      fn(static_cast<int>(i + 1), static_cast<int>(start + 1));
      pos = start + std::max<size_t>(match.size(), 1);
    }
  }
}

}  // namespace

ValidationOptions ValidationOptions::FromLimits(
    const proto::ResourceLimits& limits) {
  ValidationOptions options;
  options.allow_network = limits.enable_network_access();
  options.allow_filesystem = limits.enable_file_system_access();
  return options;
}

proto::ValidationResult Validate(const std::string& code,
                                 proto::Language language,
                                 const ValidationOptions& options) {
  Collector collector;
  std::vector<std::string> lines = absl::StrSplit(code, '\n');
  if (absl::StripAsciiWhitespace(code).empty()) {
    collector.Add("empty-code", "Empty code", RiskLevel::HIGH, 0, 0,
                  "Code cannot be empty", "");
    return collector.Summarize(0);
  }
  if (!IsSupported(language)) {
    collector.Add("unsupported-language", "Unsupported language",
                  RiskLevel::HIGH, 0, 0,
                  absl::StrCat("Unsupported language: ",
                               proto::Language_Name(language)),
                  "");
    return collector.Summarize(static_cast<int>(lines.size()));
  }

  SyntaxTree tree = Parse(code, language);
  if (!tree.well_formed) {
    collector.Add("syntax-error", "Syntax error", RiskLevel::HIGH,
                  tree.error_line, 0, tree.error,
                  "Check that brackets and quotes are balanced");
  }
  const RuleSet& rules = RulesFor(language);
  for (const StructuralRule& rule : rules.structural) {
    if (Granted(rule.capability, options)) continue;
    for (const SyntaxNode& node : tree.nodes) {
      if (!rule.Matches(node)) continue;
      collector.Add(rule.id, rule.name, rule.severity, node.line, node.column,
                    rule.message, rule.suggestion);
    }
  }
  for (const PatternRule& rule : rules.patterns) {
    if (Granted(rule.capability, options)) continue;
    ForEachMatch(rule, lines, [&](int line, int column) {
      collector.Add(rule.id, rule.name, rule.severity, line, column,
                    rule.message, rule.suggestion);
    });
  }
  proto::ValidationResult result =
      collector.Summarize(static_cast<int>(lines.size()));
  VLOG(1) << "Validated " << lines.size() << " lines of "
          << proto::Language_Name(language) << " code: risk "
          << proto::RiskLevel_Name(result.risk_level()) << ", "
          << result.findings_size() << " findings";
  return result;
}

QuickCheckResult QuickCheck(const std::string& code,
                            proto::Language language) {
  QuickCheckResult result;
  if (!IsSupported(language)) {
    result.safe = false;
    result.critical_issues.push_back(absl::StrCat(
        "Unsupported language: ", proto::Language_Name(language)));
    return result;
  }
  std::vector<std::string> lines = absl::StrSplit(code, '\n');
  for (const PatternRule& rule : RulesFor(language).patterns) {
    if (rule.severity != RiskLevel::CRITICAL) continue;
    ForEachMatch(rule, lines, [&](int line, int column) {
      result.critical_issues.push_back(
          absl::StrCat(rule.name, " (line ", line, ")"));
    });
  }
  result.safe = result.critical_issues.empty();
  return result;
}

}  // namespace validator
