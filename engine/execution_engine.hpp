#ifndef ENGINE_EXECUTION_ENGINE_HPP
#define ENGINE_EXECUTION_ENGINE_HPP

#include <atomic>
#include <stdexcept>
#include <string>
#include <vector>

#include "proto/execution.pb.h"

namespace engine {

// Failure of the engine itself (missing interpreter, sandbox errors...), as
// opposed to failures of the executed code.
class engine_error : public std::runtime_error {
 public:
  explicit engine_error(const std::string& msg) : std::runtime_error(msg) {}
};

struct ExecutionContext {
  proto::ResourceLimits limits;
  // Capabilities granted to the code, see ParseContentSecurityPolicy.
  std::string content_security_policy;
  // Where the per-execution working directories are created.
  std::string temp_directory = "/tmp/snipbox";
  bool keep_sandbox = false;
};

struct RawCounters {
  int64_t memory_kb = 0;
  int64_t peak_memory_kb = 0;
  int64_t cpu_time_millis = 0;
  int64_t wall_time_millis = 0;
  bool running = false;
};

// Why the engine stopped the code before it finished by itself.
enum class Termination { NONE, WALL_DEADLINE, CPU_DEADLINE, MEMORY_LIMIT, KILLED };

struct EngineOutput {
  std::string output;
  std::string error;
  int32_t exit_code = 0;
  // Set when output or error were cut at the maximum output size.
  bool output_truncated = false;
  Termination termination = Termination::NONE;
  std::string termination_message;
  RawCounters counters;
};

// One runtime for one language. Instances are single-use: Execute can be
// called only once, and a fresh instance must be created for each request.
class ExecutionEngine {
 public:
  virtual proto::Language GetLanguage() const = 0;
  virtual std::string Name() const = 0;

  // Runs the code, enforcing the limits of the context. Failures of the code
  // are reported in the returned output, failures of the engine throw
  // engine_error.
  EngineOutput Execute(const std::string& code,
                       const std::vector<std::string>& inputs,
                       const ExecutionContext& context);

  // Checks that the engine can run code at all. Returns false and sets
  // error_msg otherwise.
  virtual bool Probe(std::string* error_msg) { return true; }

  // Latest resource counters of the execution. When the execution is over,
  // returns the final values. Thread-safe.
  virtual RawCounters Sample() const = 0;

  // Stops the execution, if any, and releases its resources. Never blocks,
  // can be called from any thread and any number of times, also before
  // Execute.
  virtual void Release() = 0;

  virtual ~ExecutionEngine() = default;
  ExecutionEngine() = default;
  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine(ExecutionEngine&&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(ExecutionEngine&&) = delete;

 protected:
  virtual EngineOutput DoExecute(const std::string& code,
                                 const std::vector<std::string>& inputs,
                                 const ExecutionContext& context) = 0;

 private:
  std::atomic<bool> used_{false};
};

struct Capabilities {
  bool network = false;
  bool filesystem = false;
};

// Extracts the capabilities from a policy string made of directives such as
// "connect-src 'self'" (network) and "file-src 'self'" (filesystem). Missing
// directives fall back to default-src, and anything not explicitly granted is
// denied.
Capabilities ParseContentSecurityPolicy(const std::string& policy);

// Lowercase name of the language, e.g. "python".
std::string LanguageName(proto::Language language);

}  // namespace engine

#endif
