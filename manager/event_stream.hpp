#ifndef MANAGER_EVENT_STREAM_HPP
#define MANAGER_EVENT_STREAM_HPP

#include <functional>

#include "manager/event_queue.hpp"
#include "proto/execution.pb.h"

namespace manager {

// Remote receiver of the events of one environment.
struct EventSink {
  // Whether the receiver went away.
  std::function<bool()> cancelled;
  // Sends an event, returns false if the receiver cannot be reached.
  std::function<bool(const proto::Event&)> write;
  // Stops the execution of the environment.
  std::function<void()> terminate;
};

// Sends the events of the queue to the sink, up to and including the result
// of the execution. Once the sink is gone the execution is terminated, and
// the events are dropped until its result. Returns whether the sink received
// the result; returns false also if the queue is stopped before the result.
bool ForwardEvents(EventQueue* events, const EventSink& sink);

}  // namespace manager

#endif
