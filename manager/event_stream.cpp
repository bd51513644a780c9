#include "manager/event_stream.hpp"

#include "glog/logging.h"

namespace manager {

bool ForwardEvents(EventQueue* events, const EventSink& sink) {
  bool connected = true;
  auto disconnect = [&connected, &sink](const proto::Event& event) {
    connected = false;
    LOG(WARNING) << "The client of " << event.environment_id()
                 << " went away";
    sink.terminate();
  };
  absl::optional<proto::Event> event;
  while ((event = events->Dequeue())) {
    if (connected && sink.cancelled()) disconnect(*event);
    if (connected && !sink.write(*event)) disconnect(*event);
    if (event->has_result()) return connected;
  }
  return false;
}

}  // namespace manager
