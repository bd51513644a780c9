#ifndef REPORTER_RESULT_REPORTER_HPP
#define REPORTER_RESULT_REPORTER_HPP

#include <string>
#include <vector>

#include "engine/execution_engine.hpp"
#include "proto/execution.pb.h"

namespace reporter {

// Everything known about an execution once it is over.
struct ExecutionOutcome {
  engine::EngineOutput output;
  proto::ResourceLimits limits;
  proto::EnvironmentStatus status = proto::EnvironmentStatus::COMPLETED;
  // Last sample of the monitor, taken after it was stopped.
  proto::ResourceUsage last_usage;
  std::vector<proto::ResourceAlert> alerts;
  // Replaces the error reported by the engine, e.g. on forced termination.
  std::string error;
  std::vector<std::string> warnings;
};

// Escapes the characters that are significant in markup.
std::string Sanitize(const std::string& text);

// Result of code that did not pass validation, and was never run.
proto::ExecutionResult ReportValidationFailure(
    const proto::ValidationResult& validation);

// Result of a request that failed before running, for reasons other than
// validation (invalid limits, unavailable engine...).
proto::ExecutionResult ReportFailure(const std::string& error,
                                     const proto::ValidationResult& validation,
                                     proto::EnvironmentStatus status =
                                         proto::EnvironmentStatus::FAILED);

proto::ExecutionResult Report(const proto::ValidationResult& validation,
                              const ExecutionOutcome& outcome);

}  // namespace reporter

#endif
