#include "monitor/resource_monitor.hpp"

#include <utility>

#include "absl/strings/str_format.h"
#include "absl/time/time.h"
#include "glog/logging.h"

namespace monitor {
namespace {

const constexpr int kWarningFired = 1;
const constexpr int kCriticalFired = 2;

int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

std::string AlertMessage(proto::AlertKind kind, bool critical, double value,
                         double limit) {
  const char* level = critical ? "Critical" : "High";
  if (kind == proto::AlertKind::MEMORY) {
    return absl::StrFormat("%s memory usage: %.1fMB of %.0fMB", level, value,
                           limit);
  }
  return absl::StrFormat("%s CPU usage: %.0fms of %.0fms CPU time", level,
                         value, limit);
}

}  // namespace

ResourceMonitor::ResourceMonitor(Sampler sampler,
                                 const proto::ResourceLimits& limits,
                                 std::chrono::milliseconds interval)
    : sampler_(std::move(sampler)),
      limits_(limits),
      interval_(interval),
      subscribers_(std::make_shared<Subscribers>()) {}

ResourceMonitor::~ResourceMonitor() {
  Stop();
  if (thread_.joinable()) thread_.join();
}

bool ResourceMonitor::Start() {
  absl::MutexLock lock(&mutex_);
  if (started_ || stopped_) return false;
  started_ = true;
  thread_ = std::thread(&ResourceMonitor::Loop, this);
  return true;
}

bool ResourceMonitor::Stop() {
  absl::MutexLock lock(&mutex_);
  bool was_running = started_ && !stopped_;
  stopped_ = true;
  if (started_ && std::this_thread::get_id() != thread_.get_id()) {
    mutex_.Await(absl::Condition(&finished_));
  }
  return was_running;
}

Unsubscribe ResourceMonitor::Subscribe(UsageCallback callback) {
  absl::MutexLock lock(&subscribers_->mutex);
  int id = subscribers_->next_id++;
  subscribers_->usage.emplace(id, std::move(callback));
  std::weak_ptr<Subscribers> weak = subscribers_;
  return [weak, id]() {
    auto subscribers = weak.lock();
    if (!subscribers) return;
    absl::MutexLock lock(&subscribers->mutex);
    subscribers->usage.erase(id);
  };
}

Unsubscribe ResourceMonitor::SubscribeAlerts(AlertCallback callback) {
  absl::MutexLock lock(&subscribers_->mutex);
  int id = subscribers_->next_id++;
  subscribers_->alerts.emplace(id, std::move(callback));
  std::weak_ptr<Subscribers> weak = subscribers_;
  return [weak, id]() {
    auto subscribers = weak.lock();
    if (!subscribers) return;
    absl::MutexLock lock(&subscribers->mutex);
    subscribers->alerts.erase(id);
  };
}

proto::ResourceUsage ResourceMonitor::LastUsage() const {
  absl::MutexLock lock(&mutex_);
  return usage_;
}

std::vector<proto::ResourceAlert> ResourceMonitor::GetAlerts() const {
  absl::MutexLock lock(&mutex_);
  return std::vector<proto::ResourceAlert>(alerts_.begin(), alerts_.end());
}

size_t ResourceMonitor::NumSamples() const {
  absl::MutexLock lock(&mutex_);
  return num_samples_;
}

void ResourceMonitor::Loop() {
  bool stopping = false;
  while (!stopping) {
    TakeSample();
    absl::MutexLock lock(&mutex_);
    mutex_.AwaitWithTimeout(absl::Condition(&stopped_),
                            absl::FromChrono(interval_));
    stopping = stopped_;
  }
  // Final sample.
  TakeSample();
  absl::MutexLock lock(&mutex_);
  finished_ = true;
}

void ResourceMonitor::TakeSample() {
  engine::RawCounters counters = sampler_();
  proto::ResourceUsage usage;
  std::vector<proto::ResourceAlert> alerts;
  {
    absl::MutexLock lock(&mutex_);
    usage.set_memory_mb(counters.memory_kb / 1024.0);
    usage.set_execution_time_ms(counters.wall_time_millis);
    usage.set_cpu_time_ms(counters.cpu_time_millis);
    int64_t wall_delta = counters.wall_time_millis - last_wall_millis_;
    int64_t cpu_delta = counters.cpu_time_millis - last_cpu_millis_;
    if (wall_delta > 0) {
      usage.set_cpu_percent(100.0 * cpu_delta / wall_delta);
      last_wall_millis_ = counters.wall_time_millis;
      last_cpu_millis_ = counters.cpu_time_millis;
    } else {
      usage.set_cpu_percent(usage_.cpu_percent());
    }
    usage_ = usage;
    num_samples_++;
    CheckThresholds(proto::AlertKind::MEMORY, usage.memory_mb(),
                    limits_.max_memory_mb(), &alerts);
    CheckThresholds(proto::AlertKind::CPU, usage.cpu_time_ms(),
                    limits_.max_cpu_time_ms(), &alerts);
    for (const auto& alert : alerts) {
      alerts_.push_back(alert);
      if (alerts_.size() > kMaxAlerts) alerts_.pop_front();
    }
  }
  VLOG(1) << "Sample: " << usage.memory_mb() << "MB, "
          << usage.cpu_time_ms() << "ms CPU, " << usage.execution_time_ms()
          << "ms wall";

  std::vector<UsageCallback> usage_callbacks;
  std::vector<AlertCallback> alert_callbacks;
  {
    absl::MutexLock lock(&subscribers_->mutex);
    for (const auto& kv : subscribers_->usage) {
      usage_callbacks.push_back(kv.second);
    }
    for (const auto& kv : subscribers_->alerts) {
      alert_callbacks.push_back(kv.second);
    }
  }
  for (const auto& callback : usage_callbacks) callback(usage);
  for (const auto& alert : alerts) {
    for (const auto& callback : alert_callbacks) callback(alert);
  }
}

void ResourceMonitor::CheckThresholds(
    proto::AlertKind kind, double value, double limit,
    std::vector<proto::ResourceAlert>* alerts) {
  if (limit <= 0) return;
  int& fired = fired_[kind];
  auto raise = [&](bool critical) {
    proto::ResourceAlert alert;
    alert.set_severity(critical ? proto::AlertSeverity::ALERT_CRITICAL
                                : proto::AlertSeverity::ALERT_WARNING);
    alert.set_kind(kind);
    alert.set_value(value);
    alert.set_limit(limit);
    alert.set_timestamp_ms(NowMillis());
    alert.set_message(AlertMessage(kind, critical, value, limit));
    LOG(INFO) << alert.message();
    alerts->push_back(std::move(alert));
  };
  if (value >= kWarningThreshold * limit && !(fired & kWarningFired)) {
    fired |= kWarningFired;
    raise(false);
  }
  if (value >= kCriticalThreshold * limit && !(fired & kCriticalFired)) {
    fired |= kCriticalFired;
    raise(true);
  }
}

}  // namespace monitor
