#ifndef MANAGER_EVENT_QUEUE_HPP
#define MANAGER_EVENT_QUEUE_HPP

#include <queue>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/execution.pb.h"

namespace manager {

// Progress of the environments, in the order it happened. Producers never
// block; Dequeue blocks until an event is available or the queue is stopped.
class EventQueue {
 public:
  void Status(const std::string& environment_id,
              proto::EnvironmentStatus status) {
    proto::Event event;
    event.set_environment_id(environment_id);
    event.mutable_status()->set_status(status);
    Enqueue(std::move(event));
  }
  void Usage(const std::string& environment_id,
             const proto::ResourceUsage& usage) {
    proto::Event event;
    event.set_environment_id(environment_id);
    *event.mutable_usage() = usage;
    Enqueue(std::move(event));
  }
  void Alert(const std::string& environment_id,
             const proto::ResourceAlert& alert) {
    proto::Event event;
    event.set_environment_id(environment_id);
    *event.mutable_alert() = alert;
    Enqueue(std::move(event));
  }
  void Result(const std::string& environment_id,
              const proto::ExecutionResult& result) {
    proto::Event event;
    event.set_environment_id(environment_id);
    *event.mutable_result() = result;
    Enqueue(std::move(event));
  }

  void Push(proto::Event event) { Enqueue(std::move(event)); }

  // Returns the next event, or nothing once the queue is stopped and empty.
  absl::optional<proto::Event> Dequeue();
  // Events enqueued after Stop are dropped.
  void Stop();
  bool IsStopped() const;

 private:
  void Enqueue(proto::Event&& event);

  mutable absl::Mutex queue_mutex_;
  std::queue<proto::Event> queue_ GUARDED_BY(queue_mutex_);
  bool stopped_ GUARDED_BY(queue_mutex_) = false;
};

}  // namespace manager

#endif
