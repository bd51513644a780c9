#include "monitor/resource_monitor.hpp"

#include <atomic>

#include "absl/synchronization/mutex.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using namespace std::chrono_literals;

// Counters that the tests change while the monitor samples them.
class FakeProcess {
 public:
  monitor::Sampler Sampler() {
    return [this]() {
      absl::MutexLock lock(&mutex_);
      counters_.wall_time_millis += wall_step_;
      counters_.cpu_time_millis += cpu_step_;
      return counters_;
    };
  }
  void SetMemoryMb(double mb) {
    absl::MutexLock lock(&mutex_);
    counters_.memory_kb = static_cast<int64_t>(mb * 1024);
  }
  void SetCpuMillis(int64_t millis) {
    absl::MutexLock lock(&mutex_);
    counters_.cpu_time_millis = millis;
  }
  void SetSteps(int64_t wall, int64_t cpu) {
    absl::MutexLock lock(&mutex_);
    wall_step_ = wall;
    cpu_step_ = cpu;
  }

 private:
  absl::Mutex mutex_;
  engine::RawCounters counters_;
  int64_t wall_step_ = 0;
  int64_t cpu_step_ = 0;
};

template <typename F>
bool WaitFor(F condition) {
  for (int i = 0; i < 500; i++) {
    if (condition()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return false;
}

proto::ResourceLimits Limits(int64_t memory_mb, int64_t cpu_ms) {
  proto::ResourceLimits limits;
  limits.set_max_memory_mb(memory_mb);
  limits.set_max_cpu_time_ms(cpu_ms);
  return limits;
}

TEST(ResourceMonitor, SamplesAndNotifies) {
  FakeProcess process;
  process.SetMemoryMb(1);
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 5000), 5ms);
  std::atomic<int> calls{0};
  auto unsubscribe =
      monitor.Subscribe([&](const proto::ResourceUsage& usage) { calls++; });
  EXPECT_TRUE(monitor.Start());
  EXPECT_FALSE(monitor.Start());
  EXPECT_TRUE(WaitFor([&]() { return calls >= 3; }));
  EXPECT_TRUE(monitor.Stop());
  EXPECT_FALSE(monitor.Stop());
  EXPECT_DOUBLE_EQ(monitor.LastUsage().memory_mb(), 1.0);
  EXPECT_EQ(monitor.LastUsage().network_requests(), 0);
  EXPECT_EQ(static_cast<size_t>(calls.load()), monitor.NumSamples());
  EXPECT_TRUE(monitor.GetAlerts().empty());
}

TEST(ResourceMonitor, FirstSampleIsImmediate) {
  FakeProcess process;
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 5000), 1h);
  monitor.Start();
  EXPECT_TRUE(WaitFor([&]() { return monitor.NumSamples() == 1u; }));
}

TEST(ResourceMonitor, FinalSampleOnStop) {
  FakeProcess process;
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 5000), 1h);
  monitor.Start();
  ASSERT_TRUE(WaitFor([&]() { return monitor.NumSamples() == 1u; }));
  process.SetMemoryMb(4);
  EXPECT_TRUE(monitor.Stop());
  EXPECT_EQ(monitor.NumSamples(), 2u);
  EXPECT_DOUBLE_EQ(monitor.LastUsage().memory_mb(), 4.0);
}

TEST(ResourceMonitor, MemoryThresholdsFireOnce) {
  FakeProcess process;
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(10, 5000), 5ms);
  std::atomic<int> alerts{0};
  monitor.SubscribeAlerts([&](const proto::ResourceAlert& alert) { alerts++; });
  process.SetMemoryMb(6);
  monitor.Start();
  ASSERT_TRUE(WaitFor([&]() { return alerts == 1; }));
  size_t samples = monitor.NumSamples();
  ASSERT_TRUE(WaitFor([&]() { return monitor.NumSamples() > samples + 3; }));
  EXPECT_EQ(alerts.load(), 1);
  process.SetMemoryMb(9.5);
  ASSERT_TRUE(WaitFor([&]() { return alerts == 2; }));
  samples = monitor.NumSamples();
  ASSERT_TRUE(WaitFor([&]() { return monitor.NumSamples() > samples + 3; }));
  monitor.Stop();

  auto history = monitor.GetAlerts();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].severity(), proto::ALERT_WARNING);
  EXPECT_EQ(history[0].kind(), proto::MEMORY);
  EXPECT_EQ(history[0].message(), "High memory usage: 6.0MB of 10MB");
  EXPECT_EQ(history[1].severity(), proto::ALERT_CRITICAL);
  EXPECT_EQ(history[1].message(), "Critical memory usage: 9.5MB of 10MB");
  EXPECT_DOUBLE_EQ(history[1].limit(), 10);
  EXPECT_GT(history[1].timestamp_ms(), 0);
}

TEST(ResourceMonitor, CpuThresholdsTogether) {
  FakeProcess process;
  process.SetCpuMillis(950);
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 1000), 1h);
  monitor.Start();
  ASSERT_TRUE(WaitFor([&]() { return monitor.NumSamples() == 1u; }));
  monitor.Stop();
  auto history = monitor.GetAlerts();
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].severity(), proto::ALERT_WARNING);
  EXPECT_EQ(history[1].severity(), proto::ALERT_CRITICAL);
  EXPECT_EQ(history[1].kind(), proto::CPU);
  EXPECT_THAT(history[1].message(), HasSubstr("950ms of 1000ms"));
}

TEST(ResourceMonitor, CpuPercent) {
  FakeProcess process;
  process.SetSteps(100, 50);
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 1000000),
                                   5ms);
  monitor.Start();
  ASSERT_TRUE(WaitFor([&]() { return monitor.NumSamples() >= 3; }));
  monitor.Stop();
  EXPECT_DOUBLE_EQ(monitor.LastUsage().cpu_percent(), 50.0);
}

TEST(ResourceMonitor, Unsubscribe) {
  FakeProcess process;
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 5000), 5ms);
  std::atomic<int> calls{0};
  auto unsubscribe =
      monitor.Subscribe([&](const proto::ResourceUsage& usage) { calls++; });
  monitor.Start();
  ASSERT_TRUE(WaitFor([&]() { return calls >= 1; }));
  unsubscribe();
  unsubscribe();
  int seen = calls;
  size_t samples = monitor.NumSamples();
  ASSERT_TRUE(WaitFor([&]() { return monitor.NumSamples() > samples + 3; }));
  // At most one callback can be in flight while unsubscribing.
  EXPECT_LE(calls.load(), seen + 1);
  monitor.Stop();
}

TEST(ResourceMonitor, UnsubscribeAfterDestruction) {
  FakeProcess process;
  monitor::Unsubscribe unsubscribe;
  {
    monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 5000), 5ms);
    unsubscribe = monitor.Subscribe([](const proto::ResourceUsage&) {});
  }
  unsubscribe();
}

TEST(ResourceMonitor, StopFromCallback) {
  FakeProcess process;
  process.SetMemoryMb(31);
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 5000), 5ms);
  std::atomic<int> stopped{0};
  monitor.SubscribeAlerts([&](const proto::ResourceAlert& alert) {
    if (alert.severity() == proto::ALERT_CRITICAL && monitor.Stop()) {
      stopped++;
    }
  });
  monitor.Start();
  ASSERT_TRUE(WaitFor([&]() { return stopped == 1; }));
  EXPECT_FALSE(monitor.Stop());
  EXPECT_EQ(stopped.load(), 1);
}

TEST(ResourceMonitor, StopBeforeStart) {
  FakeProcess process;
  monitor::ResourceMonitor monitor(process.Sampler(), Limits(32, 5000), 5ms);
  EXPECT_FALSE(monitor.Stop());
  EXPECT_FALSE(monitor.Start());
  EXPECT_EQ(monitor.NumSamples(), 0u);
}

}  // namespace
