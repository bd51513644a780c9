#include "manager/event_queue.hpp"

namespace manager {

void EventQueue::Enqueue(proto::Event&& event) {
  absl::MutexLock lck(&queue_mutex_);
  if (stopped_) return;
  queue_.push(std::move(event));
}

absl::optional<proto::Event> EventQueue::Dequeue() {
  absl::MutexLock lck(&queue_mutex_);
  auto cond = [this]() {
    queue_mutex_.AssertHeld();
    return stopped_ || !queue_.empty();
  };
  queue_mutex_.Await(absl::Condition(&cond));
  if (queue_.empty()) return {};
  absl::optional<proto::Event> event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void EventQueue::Stop() {
  absl::MutexLock lck(&queue_mutex_);
  stopped_ = true;
}

bool EventQueue::IsStopped() const {
  absl::MutexLock lck(&queue_mutex_);
  return stopped_;
}

}  // namespace manager
