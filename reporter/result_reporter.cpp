#include "reporter/result_reporter.hpp"

#include <algorithm>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace reporter {
namespace {

const char* SeverityName(proto::AlertSeverity severity) {
  switch (severity) {
    case proto::AlertSeverity::ALERT_CRITICAL:
      return "critical";
    case proto::AlertSeverity::ALERT_ERROR:
      return "error";
    default:
      return "warning";
  }
}

}  // namespace

std::string Sanitize(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    switch (c) {
      case '&':
        out += "&amp;";
        break;
      case '<':
        out += "&lt;";
        break;
      case '>':
        out += "&gt;";
        break;
      case '"':
        out += "&quot;";
        break;
      case '\'':
        out += "&#39;";
        break;
      default:
        out += c;
    }
  }
  return out;
}

proto::ExecutionResult ReportValidationFailure(
    const proto::ValidationResult& validation) {
  proto::ExecutionResult result = ReportFailure(
      absl::StrCat("Security validation failed: ",
                   absl::StrJoin(validation.errors(), "; ")),
      validation);
  for (const auto& warning : validation.warnings()) {
    result.add_warnings(warning);
  }
  return result;
}

proto::ExecutionResult ReportFailure(const std::string& error,
                                     const proto::ValidationResult& validation,
                                     proto::EnvironmentStatus status) {
  proto::ExecutionResult result;
  result.set_success(false);
  result.set_exit_code(1);
  result.set_error(error);
  result.set_status(status);
  *result.mutable_validation_result() = validation;
  return result;
}

proto::ExecutionResult Report(const proto::ValidationResult& validation,
                              const ExecutionOutcome& outcome) {
  const engine::EngineOutput& output = outcome.output;
  proto::ExecutionResult result;
  *result.mutable_validation_result() = validation;
  result.set_status(outcome.status);
  result.set_output(output.output);
  result.set_sanitized_output(Sanitize(output.output));
  result.set_output_truncated(output.output_truncated);

  std::string error = outcome.error;
  if (error.empty() && output.termination != engine::Termination::NONE) {
    error = output.termination_message;
  }
  if (!error.empty() && !output.error.empty()) {
    absl::StrAppend(&error, "\n", output.error);
  } else if (error.empty()) {
    error = output.error;
  }
  result.set_error(error);

  bool success = outcome.status == proto::EnvironmentStatus::COMPLETED &&
                 output.exit_code == 0 &&
                 output.termination == engine::Termination::NONE &&
                 outcome.error.empty();
  result.set_success(success);
  result.set_exit_code(!success && output.exit_code == 0 ? 1
                                                         : output.exit_code);

  int64_t wall_millis = outcome.last_usage.execution_time_ms() > 0
                            ? outcome.last_usage.execution_time_ms()
                            : output.counters.wall_time_millis;
  result.set_execution_time_ms(wall_millis);
  result.set_memory_usage_mb(
      std::max(outcome.last_usage.memory_mb(),
               output.counters.peak_memory_kb / 1024.0));
  result.set_cpu_time_ms(std::max(outcome.last_usage.cpu_time_ms(),
                                  output.counters.cpu_time_millis));

  for (const auto& warning : validation.warnings()) {
    result.add_warnings(warning);
  }
  for (const auto& warning : outcome.warnings) result.add_warnings(warning);
  if (output.output_truncated) {
    result.add_warnings(absl::StrCat("Output truncated to ",
                                     outcome.limits.max_output_size(),
                                     " bytes"));
  }
  for (const auto& alert : outcome.alerts) {
    result.add_warnings(
        absl::StrCat("[", SeverityName(alert.severity()), "] ", alert.message()));
    *result.add_alerts() = alert;
  }
  return result;
}

}  // namespace reporter
