#include "sandbox/unix.hpp"

#include <algorithm>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <limits.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

int ReadProcFile(pid_t pid, const char* name, char* buf, size_t buf_size) {
  char path[64] = {};
  snprintf(path, sizeof(path), "/proc/%d/%s", pid, name);
  int fd = open(path, O_RDONLY | O_CLOEXEC);
  if (fd == -1) return -1;
  ssize_t num_read = 0;
  ssize_t cur = 0;
  do {
    cur = read(fd, buf + num_read, buf_size - 1 - num_read);
    if (cur < 0 && errno == EINTR) continue;
    if (cur < 0) {
      close(fd);
      return -1;
    }
    num_read += cur;
  } while (cur > 0 && static_cast<size_t>(num_read) < buf_size - 1);
  close(fd);
  buf[num_read] = 0;
  return num_read > 0 ? 0 : -1;
}

// Resident set size, in KiB.
int GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  char buf[256] = {};
  if (ReadProcFile(pid, "statm", buf, sizeof(buf)) == -1) return -1;
  long long size = 0;
  long long resident = 0;
  if (sscanf(buf, "%lld %lld", &size, &resident) != 2) return -1;
  static const long page_kb = sysconf(_SC_PAGESIZE) / 1024;
  *memory_usage_kb = resident * page_kb;
  return 0;
}

// User plus system time of all the threads of the process.
int GetProcessCpuTime(pid_t pid, int64_t* cpu_time_millis) {
  char buf[1024] = {};
  if (ReadProcFile(pid, "stat", buf, sizeof(buf)) == -1) return -1;
  // The command name may contain spaces and parentheses.
  const char* fields = strrchr(buf, ')');
  if (fields == nullptr) return -1;
  unsigned long utime = 0;
  unsigned long stime = 0;
  if (sscanf(fields + 1,
             " %*c %*d %*d %*d %*d %*d %*u %*lu %*lu %*lu %*lu %lu %lu",
             &utime, &stime) != 2) {
    return -1;
  }
  static const long ticks = sysconf(_SC_CLK_TCK);
  *cpu_time_millis = static_cast<int64_t>(utime + stime) * 1000 / ticks;
  return 0;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;
static const constexpr auto kWaitPollInterval = std::chrono::milliseconds(5);
static const constexpr auto kSamplePollInterval = std::chrono::milliseconds(2);

bool Unix::MakeImmutable(const std::string& input_file,
                         std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (chmod(input_file.c_str(), S_IRUSR) == -1) {
    *error_msg = "chmod: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  memory_kb_ = 0;
  peak_memory_kb_ = 0;
  cpu_time_millis_ = 0;
  wall_time_millis_ = 0;
  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

void Unix::Kill() { kill_requested_ = true; }

ProcessUsage Unix::Usage() const {
  ProcessUsage usage;
  usage.running = running_;
  usage.memory_kb = memory_kb_;
  usage.peak_memory_kb = peak_memory_kb_;
  usage.cpu_time_millis = cpu_time_millis_;
  usage.wall_time_millis =
      usage.running ? NowMillis() - start_millis_ : wall_time_millis_.load();
  return usage;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::DoFork(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    return false;
  }
  if (fork_result) {
    child_pid_ = fork_result;
    return true;
  } else {
    Child();
  }
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 2] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 2);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and the whole group can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  if (options_->stdin_file != "") {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY);
  } else {
    stdin_fd = open("/dev/null", O_RDONLY);
  }
  if (stdin_fd == -1) die("open", errno);
  int stdout_fd = options_->stdout_fd;
  int stderr_fd = options_->stderr_fd;

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // TODO: build argv and envp before forking, allocating in the child of a
  // multithreaded process can deadlock.
  std::vector<std::vector<char>> vec_args;
  std::vector<std::vector<char>> vec_env;
  auto add_arg = [](std::vector<std::vector<char>>* vec,
                    const std::string& arg) {
    vec->emplace_back(arg.begin(), arg.end());
    vec->back().push_back(0);
  };
  add_arg(&vec_args, options_->executable);
  for (const std::string& arg : options_->args) add_arg(&vec_args, arg);
  for (const std::string& var : options_->env) add_arg(&vec_env, var);
  std::vector<char*> args;
  for (std::vector<char>& arg : vec_args) args.push_back(arg.data());
  args.push_back(nullptr);
  std::vector<char*> env;
  for (std::vector<char>& var : vec_env) env.push_back(var.data());
  env.push_back(nullptr);

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  DUP(stdin, STDIN_FILENO);
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim;
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(MEMLOCK, options_->max_mlock_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(STACK, options_->max_stack_kb * 1024);
  if (options_->deny_file_writes) {
    rlim.rlim_cur = rlim.rlim_max = 0;
    if (setrlimit(RLIMIT_FSIZE, &rlim) < 0) die("setrlim FSIZE", errno);
  } else {
    SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  }
#undef SET_RLIM

  // The wait loop enforces the precise CPU limit, the rlimit only catches
  // programs that escape it.
  if (options_->cpu_limit_millis) {
    rlim.rlim_cur = (options_->cpu_limit_millis + 999) / 1000 + 1;
    rlim.rlim_max = rlim.rlim_cur + 1;
    if (setrlimit(RLIMIT_CPU, &rlim) < 0) die("setrlim CPU", errno);
  }

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }

  // Set after OnChild: in a new user namespace, the limit only counts the
  // processes of the namespace.
  if (options_->max_procs) {
    rlim.rlim_cur = rlim.rlim_max = options_->max_procs;
    if (setrlimit(RLIMIT_NPROC, &rlim) < 0) die("setrlim NPROC", errno);
  }
  int count = 0;
  do {
    if (options_->env.empty()) {
      execv(options_->executable.c_str(), args.data());
    } else {
      execve(options_->executable.c_str(), args.data(), env.data());
    }
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  close(pipe_fds_[1]);
  int error_len = 0;
  ssize_t header = 0;
  do {
    header = read(pipe_fds_[0], &error_len, sizeof(error_len));
  } while (header == -1 && errno == EINTR);
  if (header == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    error_len = std::max(0, std::min<int>(error_len, PIPE_BUF - 1));
    if (read(pipe_fds_[0], error, error_len) <= 0) {
      strncpy(error, "child: unknown error", PIPE_BUF - 1);
    }
    close(pipe_fds_[0]);
    waitpid(child_pid_, nullptr, 0);
    *error_msg = error;
    return false;
  }
  close(pipe_fds_[0]);

  start_millis_ = NowMillis();
  running_ = true;
  std::atomic<bool> done{false};
  std::thread usage_watcher(
      [this, &done](int pid) {
        while (!done) {
          int64_t mem = 0;
          if (GetProcessMemoryUsage(pid, &mem) == 0) {
            memory_kb_ = mem;
            if (mem > peak_memory_kb_) peak_memory_kb_ = mem;
          }
          int64_t cpu = 0;
          if (GetProcessCpuTime(pid, &cpu) == 0) cpu_time_millis_ = cpu;
          std::this_thread::sleep_for(kSamplePollInterval);
        }
      },
      child_pid_);

  auto elapsed_millis = [this]() { return NowMillis() - start_millis_; };
  auto stop_watcher = [this, &done, &usage_watcher, &elapsed_millis]() {
    done = true;
    usage_watcher.join();
    wall_time_millis_ = elapsed_millis();
    running_ = false;
  };

  // wait4 reports the usage of this child only: getrusage(RUSAGE_CHILDREN)
  // would also count the other sandboxes of the process.
  int child_status = 0;
  bool has_exited = false;
  struct rusage rusage {};
  while (true) {
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1 && errno != EINTR) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      kill(-child_pid_, SIGKILL);
      stop_watcher();
      return false;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    if (kill_requested_) {
      info->killed = true;
      break;
    }
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->wall_limit_exceeded = true;
      break;
    }
    if (options_->cpu_limit_millis &&
        cpu_time_millis_ >= options_->cpu_limit_millis) {
      info->cpu_limit_exceeded = true;
      break;
    }
    if (options_->rss_limit_kb && memory_kb_ > options_->rss_limit_kb) {
      info->memory_limit_exceeded = true;
      break;
    }
    std::this_thread::sleep_for(kWaitPollInterval);
  }
  // Also takes care of anything the program left running in its group.
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH && !has_exited) {
    if (kill(child_pid_, SIGKILL) == -1 && errno != ESRCH) {
      *error_msg = "kill: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      stop_watcher();
      return false;
    }
  }
  if (!has_exited) {
    int ret = 0;
    do {
      ret = wait4(child_pid_, &child_status, 0, &rusage);
    } while (ret == -1 && errno == EINTR);
    if (ret != child_pid_) {
      *error_msg = "wait4: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      stop_watcher();
      return false;
    }
  }
  stop_watcher();
  info->memory_usage_kb = peak_memory_kb_;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = wall_time_millis_;
  info->cpu_time_millis =
      (int64_t)rusage.ru_utime.tv_sec * 1000 + rusage.ru_utime.tv_usec / 1000;
  info->sys_time_millis =
      (int64_t)rusage.ru_stime.tv_sec * 1000 + rusage.ru_stime.tv_usec / 1000;
  cpu_time_millis_ = info->cpu_time_millis + info->sys_time_millis;
  // Killed by RLIMIT_CPU before the wait loop noticed.
  if (info->signal == SIGXCPU ||
      (info->signal == SIGKILL && has_exited && options_->cpu_limit_millis &&
       cpu_time_millis_ >= options_->cpu_limit_millis)) {
    info->cpu_limit_exceeded = true;
  }

  OnFinish(info);
  return true;
}

namespace {
Sandbox::Register<Unix> r;
}  // namespace

}  // namespace sandbox
