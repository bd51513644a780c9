#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Sandboxes
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_string(python_interpreter);
DECLARE_string(node_interpreter);

// Monitoring and termination
DECLARE_int32(sampling_interval_ms);
DECLARE_int32(termination_grace_ms);
DECLARE_bool(escalate_cpu_alerts);

// Upper bounds for per-request limits
DECLARE_int64(max_memory_cap_mb);
DECLARE_int64(max_cpu_time_cap_ms);
DECLARE_int64(max_execution_time_cap_ms);
DECLARE_int64(max_output_size_cap);

#endif
