#ifndef MONITOR_RESOURCE_MONITOR_HPP
#define MONITOR_RESOURCE_MONITOR_HPP

#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <thread>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "engine/execution_engine.hpp"
#include "proto/execution.pb.h"

namespace monitor {

using Sampler = std::function<engine::RawCounters()>;
using UsageCallback = std::function<void(const proto::ResourceUsage&)>;
using AlertCallback = std::function<void(const proto::ResourceAlert&)>;
// Removes a subscription. Can be called more than once, also after the
// monitor is gone.
using Unsubscribe = std::function<void()>;

// Fractions of a limit that raise a warning and a critical alert.
const constexpr double kWarningThreshold = 0.5;
const constexpr double kCriticalThreshold = 0.9;
const constexpr size_t kMaxAlerts = 50;

// Samples the resource usage of one execution at a fixed interval, and
// reports it to the subscribers. Memory and CPU time crossing a threshold of
// their limit raise an alert, at most once per threshold. The monitor only
// observes: acting on alerts is up to the subscribers.
class ResourceMonitor {
 public:
  ResourceMonitor(Sampler sampler, const proto::ResourceLimits& limits,
                  std::chrono::milliseconds interval);
  ~ResourceMonitor();

  // Starts sampling, taking the first sample right away. Returns false if
  // the monitor was already started or stopped.
  bool Start();

  // Stops sampling and waits for a final sample. Returns true only for the
  // call that actually stopped a running monitor. When called from a
  // subscriber, the final sample is taken as soon as the callback returns.
  bool Stop();

  // Callbacks run on the sampling thread and must not block.
  Unsubscribe Subscribe(UsageCallback callback);
  Unsubscribe SubscribeAlerts(AlertCallback callback);

  proto::ResourceUsage LastUsage() const;
  std::vector<proto::ResourceAlert> GetAlerts() const;
  size_t NumSamples() const;

  ResourceMonitor(const ResourceMonitor&) = delete;
  ResourceMonitor& operator=(const ResourceMonitor&) = delete;

 private:
  struct Subscribers {
    absl::Mutex mutex;
    int next_id GUARDED_BY(mutex) = 0;
    std::map<int, UsageCallback> usage GUARDED_BY(mutex);
    std::map<int, AlertCallback> alerts GUARDED_BY(mutex);
  };

  void Loop();
  void TakeSample();
  // Appends to alerts the threshold crossings of value over limit.
  void CheckThresholds(proto::AlertKind kind, double value, double limit,
                       std::vector<proto::ResourceAlert>* alerts)
      EXCLUSIVE_LOCKS_REQUIRED(mutex_);

  Sampler sampler_;
  const proto::ResourceLimits limits_;
  const std::chrono::milliseconds interval_;
  std::shared_ptr<Subscribers> subscribers_;
  std::thread thread_;

  mutable absl::Mutex mutex_;
  bool started_ GUARDED_BY(mutex_) = false;
  bool stopped_ GUARDED_BY(mutex_) = false;
  // The final sample was taken.
  bool finished_ GUARDED_BY(mutex_) = false;
  proto::ResourceUsage usage_ GUARDED_BY(mutex_);
  std::deque<proto::ResourceAlert> alerts_ GUARDED_BY(mutex_);
  size_t num_samples_ GUARDED_BY(mutex_) = 0;
  int64_t last_cpu_millis_ GUARDED_BY(mutex_) = 0;
  int64_t last_wall_millis_ GUARDED_BY(mutex_) = 0;
  // Thresholds that already fired, per alert kind.
  std::map<proto::AlertKind, int> fired_ GUARDED_BY(mutex_);
};

}  // namespace monitor

#endif
