#ifndef MANAGER_ENVIRONMENT_MANAGER_HPP
#define MANAGER_ENVIRONMENT_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "engine/engine_registry.hpp"
#include "manager/event_queue.hpp"
#include "monitor/resource_monitor.hpp"
#include "proto/execution.pb.h"

namespace manager {

// The requested operation is not allowed in the current status of the
// environment.
class invalid_transition : public std::logic_error {
 public:
  explicit invalid_transition(const std::string& msg) : std::logic_error(msg) {}
};

struct ManagerOptions {
  std::chrono::milliseconds sampling_interval{500};
  // How long Terminate waits for the execution to stop.
  std::chrono::milliseconds termination_grace{2000};
  // Terminate on critical CPU alerts, not only on critical memory alerts.
  bool escalate_cpu_alerts = false;
  std::string temp_directory = "/tmp/snipbox";
  bool keep_sandboxes = false;

  static ManagerOptions FromFlags();
};

using ResultCallback = std::function<void(const proto::ExecutionResult&)>;

// Owns the sandbox environments and runs their executions. Each environment
// runs one request at a time on its own worker thread, going through
// validation, the engine and the resource monitor, and ends up completed,
// failed or terminated. A finished environment must be reset before running
// again.
//
// Operations on unknown ids throw std::out_of_range, operations not allowed in
// the current status throw invalid_transition.
class EnvironmentManager {
 public:
  // The registry and the event queue, if any, must outlive the manager.
  EnvironmentManager(const engine::EngineRegistry* registry,
                     ManagerOptions options, EventQueue* events = nullptr);
  // Terminates the running executions and waits for the workers.
  ~EnvironmentManager();

  // Creates an idle environment and returns its id.
  std::string CreateEnvironment(const proto::ResourceLimits& limits = {});

  // Starts the request on an idle environment and returns immediately. The
  // request limits replace the ones of the environment, if given. The
  // callback is called exactly once with the final result, from the worker
  // thread or from the thread that terminated the execution.
  void Run(const std::string& id, const proto::CodeExecutionRequest& request,
           ResultCallback callback = nullptr);

  // Runs the request on a new environment, whose id is stored in
  // environment_id if not null.
  std::future<proto::ExecutionResult> Submit(
      const proto::CodeExecutionRequest& request,
      std::string* environment_id = nullptr);
  std::string Submit(const proto::CodeExecutionRequest& request,
                     ResultCallback callback);

  // Stops the environment. Does nothing if it already finished. Returns after
  // at most the termination grace period, and a running execution always
  // ends up terminated.
  void Terminate(const std::string& id);

  // Brings a finished environment back to idle, clearing its usage, alerts
  // and result.
  void Reset(const std::string& id);

  // Forgets the environment, terminating it if running.
  void Release(const std::string& id);

  proto::EnvironmentStatus Status(const std::string& id) const;
  proto::ResourceUsage Usage(const std::string& id) const;
  std::vector<proto::ResourceAlert> GetAlerts(const std::string& id) const;
  absl::optional<proto::ExecutionResult> LastResult(
      const std::string& id) const;
  std::vector<std::string> Environments() const;

  EnvironmentManager(const EnvironmentManager&) = delete;
  EnvironmentManager& operator=(const EnvironmentManager&) = delete;

 private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  struct Environment {
    std::string id;
    proto::ResourceLimits config;
    proto::EnvironmentStatus status = proto::EnvironmentStatus::IDLE;
    // Incremented by Run and Reset. Stale callbacks of older runs are ignored.
    int64_t run = 0;
    proto::ResourceUsage usage;
    std::vector<proto::ResourceAlert> alerts;
    absl::optional<proto::ExecutionResult> result;
    // Why the current execution is being stopped, empty if it is not.
    std::string stop_reason;
    ResultCallback callback;
    std::shared_ptr<engine::ExecutionEngine> engine;
    std::shared_ptr<monitor::ResourceMonitor> monitor;
    Worker worker;
  };
  using EnvironmentPtr = std::shared_ptr<Environment>;

  EnvironmentPtr Find(const std::string& id) const
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);
  // Body of the worker of one run.
  void Execute(const EnvironmentPtr& env, int64_t run,
               const proto::CodeExecutionRequest& request,
               const proto::ResourceLimits& limits);
  proto::ExecutionResult ExecuteStages(
      const EnvironmentPtr& env, int64_t run,
      const proto::CodeExecutionRequest& request,
      const proto::ResourceLimits& limits);
  void OnAlert(const EnvironmentPtr& env, int64_t run,
               const proto::ResourceAlert& alert);
  // Marks the execution as being stopped and stops its monitor and engine.
  // Returns false if the run is not the current one or already finished.
  bool RequestStop(const EnvironmentPtr& env, int64_t run,
                   const std::string& reason);
  // Stores the result of the run and calls the callback, unless the run is
  // not the current one or its result was already delivered.
  void Finish(const EnvironmentPtr& env, int64_t run,
              proto::ExecutionResult result);
  // Joins the workers that are done.
  void CollectWorkers() EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  const engine::EngineRegistry* registry_;
  const ManagerOptions options_;
  EventQueue* events_;

  mutable absl::Mutex mutex_;
  std::map<std::string, EnvironmentPtr> environments_ GUARDED_BY(mutex_);
  // Workers of released or reset environments that may still be running.
  std::vector<Worker> retired_ GUARDED_BY(mutex_);
  int64_t next_id_ GUARDED_BY(mutex_) = 0;
  std::mt19937 rng_ GUARDED_BY(mutex_);
};

}  // namespace manager

#endif
