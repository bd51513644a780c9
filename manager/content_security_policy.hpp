#ifndef MANAGER_CONTENT_SECURITY_POLICY_HPP
#define MANAGER_CONTENT_SECURITY_POLICY_HPP

#include <string>

#include "proto/execution.pb.h"

namespace manager {

// Policy string granting the capabilities enabled in the limits, and denying
// everything else. See engine::ParseContentSecurityPolicy.
std::string BuildContentSecurityPolicy(const proto::ResourceLimits& limits);

}  // namespace manager

#endif
