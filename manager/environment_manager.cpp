#include "manager/environment_manager.hpp"

#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/time/time.h"
#include "glog/logging.h"
#include "manager/content_security_policy.hpp"
#include "manager/limits.hpp"
#include "reporter/result_reporter.hpp"
#include "util/flags.hpp"
#include "validator/validator.hpp"

namespace manager {
namespace {

std::string StatusName(proto::EnvironmentStatus status) {
  return proto::EnvironmentStatus_Name(status);
}

}  // namespace

ManagerOptions ManagerOptions::FromFlags() {
  ManagerOptions options;
  options.sampling_interval =
      std::chrono::milliseconds(FLAGS_sampling_interval_ms);
  options.termination_grace =
      std::chrono::milliseconds(FLAGS_termination_grace_ms);
  options.escalate_cpu_alerts = FLAGS_escalate_cpu_alerts;
  options.temp_directory = FLAGS_temp_directory;
  options.keep_sandboxes = FLAGS_keep_sandboxes;
  return options;
}

EnvironmentManager::EnvironmentManager(const engine::EngineRegistry* registry,
                                       ManagerOptions options,
                                       EventQueue* events)
    : registry_(registry),
      options_(std::move(options)),
      events_(events),
      rng_(std::random_device{}()) {
  CHECK(registry_) << "The manager needs an engine registry";
}

EnvironmentManager::~EnvironmentManager() {
  std::vector<std::pair<EnvironmentPtr, int64_t>> running;
  {
    absl::MutexLock lock(&mutex_);
    for (const auto& kv : environments_) {
      if (kv.second->status == proto::EnvironmentStatus::RUNNING) {
        running.emplace_back(kv.second, kv.second->run);
      }
    }
  }
  for (const auto& env : running) {
    RequestStop(env.first, env.second, "Execution terminated by shutdown");
  }
  std::vector<Worker> workers;
  {
    absl::MutexLock lock(&mutex_);
    for (auto& kv : environments_) {
      if (kv.second->worker.thread.joinable()) {
        workers.push_back(std::move(kv.second->worker));
      }
    }
    for (auto& worker : retired_) workers.push_back(std::move(worker));
    retired_.clear();
  }
  for (auto& worker : workers) worker.thread.join();
}

EnvironmentManager::EnvironmentPtr EnvironmentManager::Find(
    const std::string& id) const {
  auto it = environments_.find(id);
  if (it == environments_.end()) {
    throw std::out_of_range(absl::StrCat("Unknown environment: ", id));
  }
  return it->second;
}

void EnvironmentManager::CollectWorkers() {
  auto it = retired_.begin();
  while (it != retired_.end()) {
    if (it->done->load()) {
      it->thread.join();
      it = retired_.erase(it);
    } else {
      ++it;
    }
  }
}

std::string EnvironmentManager::CreateEnvironment(
    const proto::ResourceLimits& limits) {
  absl::MutexLock lock(&mutex_);
  CollectWorkers();
  auto env = std::make_shared<Environment>();
  env->id = absl::StrCat("sbx-", ++next_id_, "-",
                         absl::Hex(rng_() & 0xffffff, absl::kZeroPad6));
  env->config = ApplyDefaults(limits);
  environments_.emplace(env->id, env);
  LOG(INFO) << "Created environment " << env->id;
  return env->id;
}

void EnvironmentManager::Run(const std::string& id,
                             const proto::CodeExecutionRequest& request,
                             ResultCallback callback) {
  absl::MutexLock lock(&mutex_);
  CollectWorkers();
  EnvironmentPtr env = Find(id);
  if (env->status != proto::EnvironmentStatus::IDLE) {
    throw invalid_transition(absl::StrCat("Environment ", id, " is ",
                                          StatusName(env->status),
                                          ", not IDLE"));
  }
  if (request.has_limits()) env->config = ApplyDefaults(request.limits());
  int64_t run = ++env->run;
  env->status = proto::EnvironmentStatus::RUNNING;
  env->usage.Clear();
  env->alerts.clear();
  env->result.reset();
  env->stop_reason.clear();
  env->callback = std::move(callback);
  if (events_) events_->Status(id, proto::EnvironmentStatus::RUNNING);

  if (env->worker.thread.joinable()) retired_.push_back(std::move(env->worker));
  auto done = std::make_shared<std::atomic<bool>>(false);
  proto::ResourceLimits limits = env->config;
  env->worker.done = done;
  env->worker.thread = std::thread([this, env, run, request, limits, done]() {
    Execute(env, run, request, limits);
    *done = true;
  });
  LOG(INFO) << "Started " << engine::LanguageName(request.language())
            << " execution in " << id;
}

std::future<proto::ExecutionResult> EnvironmentManager::Submit(
    const proto::CodeExecutionRequest& request, std::string* environment_id) {
  auto promise = std::make_shared<std::promise<proto::ExecutionResult>>();
  std::future<proto::ExecutionResult> future = promise->get_future();
  std::string id =
      Submit(request, [promise](const proto::ExecutionResult& result) {
        promise->set_value(result);
      });
  if (environment_id) *environment_id = id;
  return future;
}

std::string EnvironmentManager::Submit(
    const proto::CodeExecutionRequest& request, ResultCallback callback) {
  std::string id = CreateEnvironment(request.limits());
  Run(id, request, std::move(callback));
  return id;
}

void EnvironmentManager::Execute(const EnvironmentPtr& env, int64_t run,
                                 const proto::CodeExecutionRequest& request,
                                 const proto::ResourceLimits& limits) {
  proto::ExecutionResult result;
  try {
    result = ExecuteStages(env, run, request, limits);
  } catch (const std::exception& e) {
    LOG(WARNING) << "Execution in " << env->id << " failed: " << e.what();
    result = reporter::ReportFailure(e.what(), proto::ValidationResult());
  }
  result.set_environment_id(env->id);
  Finish(env, run, std::move(result));
}

proto::ExecutionResult EnvironmentManager::ExecuteStages(
    const EnvironmentPtr& env, int64_t run,
    const proto::CodeExecutionRequest& request,
    const proto::ResourceLimits& limits) {
  std::string error;
  if (!CheckLimits(limits, &error)) {
    LOG(WARNING) << "Rejected limits in " << env->id << ": " << error;
    return reporter::ReportFailure(error, proto::ValidationResult());
  }

  proto::ValidationResult validation = validator::Validate(
      request.code(), request.language(),
      validator::ValidationOptions::FromLimits(limits));
  if (!validation.valid()) {
    LOG(INFO) << "Validation failed in " << env->id << ": "
              << absl::StrJoin(validation.errors(), "; ");
    return reporter::ReportValidationFailure(validation);
  }

  std::shared_ptr<engine::ExecutionEngine> engine;
  try {
    engine = registry_->Create(request.language());
  } catch (const engine::engine_error& e) {
    LOG(WARNING) << "Cannot create an engine for " << env->id << ": "
                 << e.what();
    return reporter::ReportFailure(e.what(), validation);
  }

  auto resource_monitor = std::make_shared<monitor::ResourceMonitor>(
      [engine]() { return engine->Sample(); }, limits,
      options_.sampling_interval);
  std::weak_ptr<Environment> weak_env = env;
  resource_monitor->Subscribe(
      [this, weak_env, run](const proto::ResourceUsage& usage) {
        EnvironmentPtr env = weak_env.lock();
        if (!env) return;
        absl::MutexLock lock(&mutex_);
        if (env->run != run) return;
        env->usage = usage;
        if (events_) events_->Usage(env->id, usage);
      });
  resource_monitor->SubscribeAlerts(
      [this, weak_env, run](const proto::ResourceAlert& alert) {
        EnvironmentPtr env = weak_env.lock();
        if (env) OnAlert(env, run, alert);
      });

  {
    absl::MutexLock lock(&mutex_);
    if (env->run != run || !env->stop_reason.empty()) {
      return reporter::ReportFailure(env->stop_reason, validation,
                                     proto::EnvironmentStatus::TERMINATED);
    }
    env->engine = engine;
    env->monitor = resource_monitor;
  }

  engine::ExecutionContext context;
  context.limits = limits;
  context.content_security_policy = BuildContentSecurityPolicy(limits);
  context.temp_directory = options_.temp_directory;
  context.keep_sandbox = options_.keep_sandboxes;
  std::vector<std::string> inputs(request.inputs().begin(),
                                  request.inputs().end());

  resource_monitor->Start();
  reporter::ExecutionOutcome outcome;
  try {
    outcome.output = engine->Execute(request.code(), inputs, context);
  } catch (const engine::engine_error& e) {
    resource_monitor->Stop();
    LOG(WARNING) << engine->Name() << " engine failed in " << env->id << ": "
                 << e.what();
    return reporter::ReportFailure(e.what(), validation);
  }
  resource_monitor->Stop();

  outcome.limits = limits;
  outcome.last_usage = resource_monitor->LastUsage();
  outcome.alerts = resource_monitor->GetAlerts();
  {
    absl::MutexLock lock(&mutex_);
    if (env->run == run) outcome.error = env->stop_reason;
  }
  if (!outcome.error.empty() ||
      outcome.output.termination != engine::Termination::NONE) {
    outcome.status = proto::EnvironmentStatus::TERMINATED;
  } else if (outcome.output.exit_code != 0) {
    outcome.status = proto::EnvironmentStatus::FAILED;
  } else {
    outcome.status = proto::EnvironmentStatus::COMPLETED;
  }
  return reporter::Report(validation, outcome);
}

void EnvironmentManager::OnAlert(const EnvironmentPtr& env, int64_t run,
                                 const proto::ResourceAlert& alert) {
  {
    absl::MutexLock lock(&mutex_);
    if (env->run != run) return;
    env->alerts.push_back(alert);
    if (env->alerts.size() > monitor::kMaxAlerts) {
      env->alerts.erase(env->alerts.begin());
    }
    if (events_) events_->Alert(env->id, alert);
  }
  if (alert.severity() != proto::AlertSeverity::ALERT_CRITICAL) return;
  if (alert.kind() == proto::AlertKind::CPU && !options_.escalate_cpu_alerts) {
    return;
  }
  if (RequestStop(env, run, absl::StrCat("Execution terminated: ",
                                         alert.message()))) {
    LOG(WARNING) << "Escalated critical alert in " << env->id;
  }
}

bool EnvironmentManager::RequestStop(const EnvironmentPtr& env, int64_t run,
                                     const std::string& reason) {
  std::shared_ptr<engine::ExecutionEngine> engine;
  std::shared_ptr<monitor::ResourceMonitor> resource_monitor;
  {
    absl::MutexLock lock(&mutex_);
    if (env->run != run ||
        env->status != proto::EnvironmentStatus::RUNNING ||
        !env->stop_reason.empty()) {
      return false;
    }
    env->stop_reason = reason;
    engine = env->engine;
    resource_monitor = env->monitor;
  }
  LOG(WARNING) << "Stopping " << env->id << ": " << reason;
  if (resource_monitor) resource_monitor->Stop();
  if (engine) engine->Release();
  return true;
}

void EnvironmentManager::Finish(const EnvironmentPtr& env, int64_t run,
                                proto::ExecutionResult result) {
  ResultCallback callback;
  {
    absl::MutexLock lock(&mutex_);
    if (env->run != run || env->status != proto::EnvironmentStatus::RUNNING) {
      return;
    }
    env->status = result.status();
    env->result = result;
    env->engine.reset();
    env->monitor.reset();
    callback = std::move(env->callback);
    env->callback = nullptr;
    if (events_) {
      events_->Status(env->id, result.status());
      events_->Result(env->id, result);
    }
  }
  LOG(INFO) << "Environment " << env->id << " is "
            << StatusName(result.status()) << " after "
            << result.execution_time_ms() << "ms";
  if (callback) callback(result);
}

void EnvironmentManager::Terminate(const std::string& id) {
  EnvironmentPtr env;
  int64_t run;
  {
    absl::MutexLock lock(&mutex_);
    env = Find(id);
    if (env->status == proto::EnvironmentStatus::IDLE) {
      env->status = proto::EnvironmentStatus::TERMINATED;
      env->run++;
      if (events_) events_->Status(id, proto::EnvironmentStatus::TERMINATED);
      LOG(INFO) << "Terminated idle environment " << id;
      return;
    }
    if (env->status != proto::EnvironmentStatus::RUNNING) return;
    run = env->run;
  }
  RequestStop(env, run, "Execution terminated by request");

  proto::ExecutionResult result;
  {
    absl::MutexLock lock(&mutex_);
    auto finished = [&env, run]() {
      return env->run != run ||
             env->status != proto::EnvironmentStatus::RUNNING;
    };
    if (mutex_.AwaitWithTimeout(absl::Condition(&finished),
                                absl::FromChrono(options_.termination_grace))) {
      return;
    }
    LOG(WARNING) << "Environment " << id << " did not stop within "
                 << options_.termination_grace.count()
                 << "ms, reporting it as terminated";
    reporter::ExecutionOutcome outcome;
    outcome.status = proto::EnvironmentStatus::TERMINATED;
    outcome.limits = env->config;
    outcome.last_usage = env->usage;
    outcome.alerts = env->alerts;
    outcome.error = env->stop_reason;
    outcome.output.termination = engine::Termination::KILLED;
    result = reporter::Report(proto::ValidationResult(), outcome);
    result.set_environment_id(id);
  }
  Finish(env, run, std::move(result));
}

void EnvironmentManager::Reset(const std::string& id) {
  absl::MutexLock lock(&mutex_);
  EnvironmentPtr env = Find(id);
  if (env->status == proto::EnvironmentStatus::RUNNING) {
    throw invalid_transition(
        absl::StrCat("Environment ", id, " is running, terminate it first"));
  }
  if (env->status == proto::EnvironmentStatus::IDLE) return;
  env->run++;
  env->status = proto::EnvironmentStatus::IDLE;
  env->usage.Clear();
  env->alerts.clear();
  env->result.reset();
  env->stop_reason.clear();
  if (events_) events_->Status(id, proto::EnvironmentStatus::IDLE);
  VLOG(1) << "Reset environment " << id;
}

void EnvironmentManager::Release(const std::string& id) {
  Terminate(id);
  absl::MutexLock lock(&mutex_);
  auto it = environments_.find(id);
  if (it == environments_.end()) return;
  if (it->second->worker.thread.joinable()) {
    retired_.push_back(std::move(it->second->worker));
  }
  environments_.erase(it);
  CollectWorkers();
  VLOG(1) << "Released environment " << id;
}

proto::EnvironmentStatus EnvironmentManager::Status(
    const std::string& id) const {
  absl::MutexLock lock(&mutex_);
  return Find(id)->status;
}

proto::ResourceUsage EnvironmentManager::Usage(const std::string& id) const {
  absl::MutexLock lock(&mutex_);
  return Find(id)->usage;
}

std::vector<proto::ResourceAlert> EnvironmentManager::GetAlerts(
    const std::string& id) const {
  absl::MutexLock lock(&mutex_);
  return Find(id)->alerts;
}

absl::optional<proto::ExecutionResult> EnvironmentManager::LastResult(
    const std::string& id) const {
  absl::MutexLock lock(&mutex_);
  return Find(id)->result;
}

std::vector<std::string> EnvironmentManager::Environments() const {
  absl::MutexLock lock(&mutex_);
  std::vector<std::string> ids;
  for (const auto& kv : environments_) ids.push_back(kv.first);
  return ids;
}

}  // namespace manager
