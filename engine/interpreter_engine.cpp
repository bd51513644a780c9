#include "engine/interpreter_engine.hpp"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <thread>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "glog/logging.h"
#include "util/file.hpp"

namespace {

const constexpr int64_t kProbeTimeoutMillis = 10000;
const constexpr auto kDrainGrace = std::chrono::milliseconds(200);
const constexpr int kPollTimeoutMillis = 20;

// Resident memory of the interpreters running an empty program, by engine
// name and interpreter path.
ABSL_CONST_INIT absl::Mutex baseline_mutex(absl::kConstInit);
std::map<std::string, int64_t>* baselines GUARDED_BY(baseline_mutex) = nullptr;

void StoreBaseline(const std::string& key, int64_t memory_kb) {
  absl::MutexLock lock(&baseline_mutex);
  if (!baselines) baselines = new std::map<std::string, int64_t>();
  (*baselines)[key] = memory_kb;
}

bool LoadBaseline(const std::string& key, int64_t* memory_kb) {
  absl::MutexLock lock(&baseline_mutex);
  if (!baselines) return false;
  auto it = baselines->find(key);
  if (it == baselines->end()) return false;
  *memory_kb = it->second;
  return true;
}

class Pipe {
 public:
  Pipe() {
    if (pipe2(fds_, O_CLOEXEC) == -1) {
      throw engine::engine_error(std::string("pipe2: ") + strerror(errno));
    }
  }
  ~Pipe() {
    CloseRead();
    CloseWrite();
  }
  int ReadEnd() const { return fds_[0]; }
  int WriteEnd() const { return fds_[1]; }
  void CloseRead() {
    if (fds_[0] != -1) close(fds_[0]);
    fds_[0] = -1;
  }
  void CloseWrite() {
    if (fds_[1] != -1) close(fds_[1]);
    fds_[1] = -1;
  }

  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

 private:
  int fds_[2] = {-1, -1};
};

// Reads stdout and stderr of the program while it runs, keeping at most limit
// bytes of each of them. The rest is read and discarded, so that the program
// never blocks on a full pipe.
class OutputCollector {
 public:
  explicit OutputCollector(int64_t limit) : limit_(limit) {}

  // Returns when both descriptors are closed, or kDrainGrace after Stop if
  // something else keeps them open.
  void Drain(int out_fd, int err_fd) {
    struct pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* targets[2] = {&output_, &error_};
    int open_fds = 2;
    char buf[32 * 1024];
    while (open_fds > 0) {
      if (stop_requested_ &&
          std::chrono::steady_clock::now() - stop_time_ > kDrainGrace) {
        break;
      }
      int ret = poll(fds, 2, kPollTimeoutMillis);
      if (ret == -1 && errno == EINTR) continue;
      if (ret == -1) {
        PLOG(WARNING) << "poll";
        break;
      }
      for (int i = 0; i < 2; i++) {
        if (fds[i].fd == -1 || !(fds[i].revents & (POLLIN | POLLHUP | POLLERR)))
          continue;
        ssize_t n = read(fds[i].fd, buf, sizeof(buf));
        if (n == -1 && (errno == EINTR || errno == EAGAIN)) continue;
        if (n <= 0) {
          fds[i].fd = -1;
          open_fds--;
          continue;
        }
        Append(targets[i], buf, n);
      }
    }
  }

  void Stop() {
    stop_time_ = std::chrono::steady_clock::now();
    stop_requested_ = true;
  }

  std::string TakeOutput() { return std::move(output_); }
  std::string TakeError() { return std::move(error_); }
  bool Truncated() const { return truncated_; }

 private:
  void Append(std::string* target, const char* data, size_t size) {
    if (limit_ > 0 && target->size() + size > static_cast<size_t>(limit_)) {
      truncated_ = true;
      size = static_cast<size_t>(limit_) - target->size();
    }
    target->append(data, size);
  }

  int64_t limit_;
  std::string output_;
  std::string error_;
  bool truncated_ = false;
  std::atomic<bool> stop_requested_{false};
  std::chrono::steady_clock::time_point stop_time_;
};

std::string MakeInputs(const std::vector<std::string>& inputs) {
  if (inputs.empty()) return "";
  return absl::StrJoin(inputs, "\n") + "\n";
}

}  // namespace

namespace engine {

std::vector<std::string> InterpreterEngine::Environment(
    const std::string& box) const {
  return {"PATH=/usr/local/bin:/usr/bin:/bin", "HOME=" + box, "TMPDIR=" + box,
          "LANG=C.UTF-8"};
}

sandbox::Sandbox* InterpreterEngine::Attach(
    std::unique_ptr<sandbox::Sandbox> sandbox, int64_t baseline_kb) {
  absl::MutexLock lock(&mutex_);
  sandbox_ = std::move(sandbox);
  baseline_kb_ = baseline_kb;
  if (released_) sandbox_->Kill();
  return sandbox_.get();
}

RawCounters InterpreterEngine::Sample() const {
  RawCounters counters;
  absl::MutexLock lock(&mutex_);
  if (!sandbox_) return counters;
  sandbox::ProcessUsage usage = sandbox_->Usage();
  counters.memory_kb = std::max<int64_t>(0, usage.memory_kb - baseline_kb_);
  counters.peak_memory_kb =
      std::max<int64_t>(0, usage.peak_memory_kb - baseline_kb_);
  counters.cpu_time_millis = usage.cpu_time_millis;
  counters.wall_time_millis = usage.wall_time_millis;
  counters.running = usage.running;
  return counters;
}

void InterpreterEngine::Release() {
  absl::MutexLock lock(&mutex_);
  released_ = true;
  if (sandbox_) sandbox_->Kill();
}

bool InterpreterEngine::Probe(std::string* error_msg) {
  if (interpreter_.empty()) {
    *error_msg = Name() + " interpreter not found";
    return false;
  }
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) {
    *error_msg = "No sandbox available";
    return false;
  }
  if (!sb->SupportsIsolation()) {
    *error_msg =
        "The sandbox cannot isolate the network and the filesystem, user "
        "namespaces are not available";
    return false;
  }
  int devnull = open("/dev/null", O_WRONLY | O_CLOEXEC);
  if (devnull == -1) {
    *error_msg = std::string("open: ") + strerror(errno);
    return false;
  }
  sandbox::ExecutionOptions options("/", interpreter_);
  options.args = ProbeArguments();
  options.stdout_fd = devnull;
  options.stderr_fd = devnull;
  options.wall_limit_millis = kProbeTimeoutMillis;
  options.deny_file_writes = true;
  options.deny_network = true;
  sandbox::ExecutionInfo info;
  bool started = sb->Execute(options, &info, error_msg);
  close(devnull);
  if (!started) return false;
  if (info.status_code != 0 || info.signal != 0) {
    *error_msg = absl::StrCat(interpreter_, " exited with status ",
                              info.status_code, " and signal ", info.signal);
    return false;
  }
  StoreBaseline(BaselineKey(), info.memory_usage_kb);
  VLOG(1) << Name() << " uses " << info.memory_usage_kb << "KB at startup";
  return true;
}

std::string InterpreterEngine::BaselineKey() const {
  return absl::StrCat(Name(), ":", interpreter_);
}

int64_t InterpreterEngine::BaselineKb() {
  int64_t memory_kb = 0;
  if (LoadBaseline(BaselineKey(), &memory_kb)) return memory_kb;
  std::string error_msg;
  if (!Probe(&error_msg)) throw engine_error(error_msg);
  CHECK(LoadBaseline(BaselineKey(), &memory_kb));
  return memory_kb;
}

EngineOutput InterpreterEngine::DoExecute(
    const std::string& code, const std::vector<std::string>& inputs,
    const ExecutionContext& context) {
  if (interpreter_.empty()) {
    throw engine_error(Name() + " interpreter not found");
  }
  // The limits apply to the memory used on top of the interpreter itself.
  int64_t baseline_kb = BaselineKb();
  const proto::ResourceLimits& limits = context.limits;
  Capabilities capabilities =
      ParseContentSecurityPolicy(context.content_security_policy);

  util::TempDir tmp(context.temp_directory);
  if (context.keep_sandbox) tmp.Keep();
  std::string box = util::File::JoinPath(tmp.Path(), kBoxDir);
  std::string source = util::File::JoinPath(box, SourceName());
  std::string stdin_file = util::File::JoinPath(tmp.Path(), "stdin");
  util::File::MakeDirs(box);
  util::File::Write(source, PrepareSource(code, inputs));
  util::File::Write(stdin_file, MakeInputs(inputs));

  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw engine_error("No sandbox available");
  std::string error_msg;
  if (!sb->MakeImmutable(source, &error_msg)) throw engine_error(error_msg);
  if (!capabilities.filesystem &&
      chmod(box.c_str(), S_IRUSR | S_IXUSR) == -1) {
    throw engine_error(std::string("chmod: ") + strerror(errno));
  }
  if ((!capabilities.network || !capabilities.filesystem) &&
      !sb->SupportsIsolation()) {
    throw engine_error(
        "The sandbox cannot isolate the network and the filesystem");
  }

  sandbox::ExecutionOptions options(box, interpreter_);
  options.args = Arguments(SourceName(), context);
  options.env = Environment(box);
  options.stdin_file = stdin_file;
  options.wall_limit_millis = limits.max_execution_time_ms();
  options.cpu_limit_millis = limits.max_cpu_time_ms();
  options.rss_limit_kb = limits.max_memory_mb() * 1024 + baseline_kb;
  options.max_files = kMaxFiles;
  if (sb->SupportsIsolation()) options.max_procs = kMaxProcs;
  options.deny_file_writes = !capabilities.filesystem;
  options.deny_network = !capabilities.network;

  Pipe out;
  Pipe err;
  options.stdout_fd = out.WriteEnd();
  options.stderr_fd = err.WriteEnd();
  OutputCollector collector(limits.max_output_size());
  std::thread reader(&OutputCollector::Drain, &collector, out.ReadEnd(),
                     err.ReadEnd());

  sandbox::Sandbox* running = Attach(std::move(sb), baseline_kb);
  sandbox::ExecutionInfo info;
  VLOG(1) << "Running " << interpreter_ << " in " << box;
  bool started = running->Execute(options, &info, &error_msg);
  out.CloseWrite();
  err.CloseWrite();
  collector.Stop();
  reader.join();
  if (!started) throw engine_error(error_msg);

  EngineOutput result;
  result.output = collector.TakeOutput();
  result.error = collector.TakeError();
  result.output_truncated = collector.Truncated();
  result.exit_code =
      info.signal ? 128 + info.signal : static_cast<int32_t>(info.status_code);
  result.counters.peak_memory_kb =
      std::max<int64_t>(0, info.memory_usage_kb - baseline_kb);
  result.counters.memory_kb = result.counters.peak_memory_kb;
  result.counters.cpu_time_millis = info.cpu_time_millis + info.sys_time_millis;
  result.counters.wall_time_millis = info.wall_time_millis;
  if (info.killed) {
    result.termination = Termination::KILLED;
    result.termination_message = "Execution terminated";
  } else if (info.memory_limit_exceeded) {
    result.termination = Termination::MEMORY_LIMIT;
    result.termination_message = absl::StrCat(
        "Memory limit exceeded: ", limits.max_memory_mb(), "MB");
  } else if (info.wall_limit_exceeded) {
    result.termination = Termination::WALL_DEADLINE;
    result.termination_message =
        absl::StrCat("Execution timeout exceeded: wall time limit of ",
                     limits.max_execution_time_ms(), "ms reached");
  } else if (info.cpu_limit_exceeded) {
    result.termination = Termination::CPU_DEADLINE;
    result.termination_message =
        absl::StrCat("Execution timeout exceeded: CPU time limit of ",
                     limits.max_cpu_time_ms(), "ms reached");
  }
  return result;
}

}  // namespace engine
