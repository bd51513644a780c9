#include "manager/limits.hpp"

#include "absl/strings/str_cat.h"
#include "util/flags.hpp"

namespace manager {
namespace {

bool CheckOne(const char* what, int64_t value, int64_t cap, const char* unit,
              std::string* error_msg) {
  if (value < 0) {
    *error_msg = absl::StrCat(what, " limit cannot be negative");
    return false;
  }
  if (value > cap) {
    *error_msg = absl::StrCat(what, " limit cannot exceed ", cap, unit);
    return false;
  }
  return true;
}

}  // namespace

proto::ResourceLimits ApplyDefaults(const proto::ResourceLimits& limits) {
  proto::ResourceLimits result = limits;
  if (result.max_memory_mb() == 0) result.set_max_memory_mb(kDefaultMemoryMb);
  if (result.max_execution_time_ms() == 0)
    result.set_max_execution_time_ms(kDefaultExecutionTimeMs);
  if (result.max_cpu_time_ms() == 0)
    result.set_max_cpu_time_ms(kDefaultCpuTimeMs);
  if (result.max_output_size() == 0)
    result.set_max_output_size(kDefaultOutputSize);
  return result;
}

bool CheckLimits(const proto::ResourceLimits& limits, std::string* error_msg) {
  return CheckOne("Memory", limits.max_memory_mb(), FLAGS_max_memory_cap_mb,
                  "MB", error_msg) &&
         CheckOne("Execution time", limits.max_execution_time_ms(),
                  FLAGS_max_execution_time_cap_ms, "ms", error_msg) &&
         CheckOne("CPU time", limits.max_cpu_time_ms(),
                  FLAGS_max_cpu_time_cap_ms, "ms", error_msg) &&
         CheckOne("Output size", limits.max_output_size(),
                  FLAGS_max_output_size_cap, " bytes", error_msg);
}

}  // namespace manager
