#include "util/flags.hpp"

DEFINE_string(temp_directory, "/tmp/snipbox",
              "Where the sandboxes should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove sandbox directories after the execution");
DEFINE_string(python_interpreter, "python3",
              "Interpreter used for Python snippets");
DEFINE_string(node_interpreter, "node",
              "Runtime used for JavaScript and TypeScript snippets");

DEFINE_int32(sampling_interval_ms, 500,
             "Interval between two resource usage samples");
DEFINE_int32(termination_grace_ms, 2000,
             "How long a termination waits for the engine before giving up");
DEFINE_bool(escalate_cpu_alerts, false,
            "Terminate executions on critical CPU alerts too, not only on "
            "critical memory alerts");

DEFINE_int64(max_memory_cap_mb, 64, "Maximum memory limit a request may ask");
DEFINE_int64(max_cpu_time_cap_ms, 10000,
             "Maximum CPU time limit a request may ask");
DEFINE_int64(max_execution_time_cap_ms, 30000,
             "Maximum wall time limit a request may ask");
DEFINE_int64(max_output_size_cap, 10 * 1024 * 1024,
             "Maximum output size a request may ask");
