#ifndef MANAGER_LIMITS_HPP
#define MANAGER_LIMITS_HPP

#include <string>

#include "proto/execution.pb.h"

namespace manager {

const constexpr int64_t kDefaultMemoryMb = 32;
const constexpr int64_t kDefaultExecutionTimeMs = 10000;
const constexpr int64_t kDefaultCpuTimeMs = 5000;
const constexpr int64_t kDefaultOutputSize = 10 * 1024 * 1024;

// Returns a copy of limits where every zero field has its default value.
proto::ResourceLimits ApplyDefaults(const proto::ResourceLimits& limits);

// Checks the limits against the caps given by the --max_*_cap flags. Returns
// false and sets error_msg if some value is negative or above its cap.
bool CheckLimits(const proto::ResourceLimits& limits, std::string* error_msg);

}  // namespace manager

#endif
