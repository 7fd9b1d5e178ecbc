#include "toolmesh/engine/execution_engine.hpp"

namespace toolmesh {
namespace engine {

BufferedEventSource::BufferedEventSource(std::vector<EngineEvent> events)
    : events_(std::make_move_iterator(events.begin()),
              std::make_move_iterator(events.end())),
      closed_(true) {}

void BufferedEventSource::push(EngineEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(std::move(event));
  }
  cv_.notify_one();
}

void BufferedEventSource::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::optional<EngineEvent> BufferedEventSource::next() {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return closed_ || !events_.empty(); });

  if (events_.empty()) {
    return std::nullopt;
  }

  EngineEvent event = std::move(events_.front());
  events_.pop_front();
  return event;
}

} // namespace engine
} // namespace toolmesh
