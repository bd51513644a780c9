#include "manager/content_security_policy.hpp"

#include <vector>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace manager {

std::string BuildContentSecurityPolicy(const proto::ResourceLimits& limits) {
  auto source = [](bool allowed) { return allowed ? "'self'" : "'none'"; };
  std::vector<std::string> directives = {
      "default-src 'none'",
      "script-src 'unsafe-inline'",
      "style-src 'unsafe-inline'",
      absl::StrCat("connect-src ", source(limits.enable_network_access())),
      absl::StrCat("file-src ", source(limits.enable_file_system_access())),
  };
  return absl::StrJoin(directives, "; ");
}

}  // namespace manager
