#ifndef UTIL_WHICH_HPP
#define UTIL_WHICH_HPP

#include <string>

namespace util {

// Equivalent to the command-line utility which. If cmd contains a slash it is
// returned unchanged when it exists. Found paths are cached, unless the cache
// is explicitly disabled. Returns an empty string if nothing is found.
std::string which(const std::string& cmd, bool use_cache = true);

}  // namespace util

#endif
