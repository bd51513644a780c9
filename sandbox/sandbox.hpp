#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int64_t rss_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_mlock_kb = 0;
  int64_t max_stack_kb = 0;

  // Forbids the program from writing any file. Otherwise, sandboxes that
  // report SupportsIsolation only let it write inside root.
  bool deny_file_writes = false;
  // Runs the program without access to any network interface. Only honoured
  // by sandboxes that report SupportsIsolation.
  bool deny_network = false;

  std::string stdin_file = "";
  // Write ends of pipes (or files) for the output of the program, owned by
  // the caller.
  int stdout_fd = -1;
  int stderr_fd = -1;
  std::vector<std::string> args;
  // If not empty, the program is started with exactly this environment.
  std::vector<std::string> env;

  // Required values
  std::string root = "";
  std::string executable = "";
  ExecutionOptions(std::string root, std::string executable)
      : root(std::move(root)), executable(std::move(executable)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  bool killed = false;
  bool wall_limit_exceeded = false;
  bool cpu_limit_exceeded = false;
  bool memory_limit_exceeded = false;
};

// Live counters of the sandboxed process.
struct ProcessUsage {
  int64_t memory_kb = 0;
  int64_t peak_memory_kb = 0;
  int64_t cpu_time_millis = 0;
  int64_t wall_time_millis = 0;
  bool running = false;
};

// Sandbox interface. Implementations need to register themselves by creating a
// global object of type Sandbox::Register<SandboxImpl> and should define the
// Create and Score static functions. Create should return a pointer to a newly
// allocated instance of the given implementation, while Score should return a
// value that defines how "good" that sandbox is: negative if the sandbox
// should not/cannot be used in the current configuration, positive otherwise
// (a bigger value means a better sandbox).
// Registering a sandbox is not thread-safe and should be done before any
// threads are created.
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Makes a file read-only for the sandboxed program. Returns false on error,
  // and sets error_msg.
  virtual bool MakeImmutable(const std::string& input_file,
                             std::string* error_msg) {
    return true;
  }

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Asks for the running program to be killed. Can be called from any thread,
  // any number of times, even before Execute.
  virtual void Kill() = 0;

  // Returns the latest counters of the program. Can be called from any thread.
  virtual ProcessUsage Usage() const = 0;

  // Whether the sandbox hides the network and the host filesystem from the
  // program. Sandboxes that do not can only enforce deny_file_writes for
  // growing files.
  virtual bool SupportsIsolation() const { return false; }

  // Constructor and destructors
  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;

  template <typename T>
  class Register {
   public:
    Register() { Sandbox::Register_(&T::Create, &T::Score); }
  };

 private:
  using store_t = std::vector<std::pair<create_t, score_t>>;
  static store_t* Boxes_();
  static void Register_(create_t, score_t);
  template <typename T>
  friend class Register;
};

}  // namespace sandbox

#endif
