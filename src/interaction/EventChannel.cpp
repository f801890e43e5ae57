#include "graphview/interaction/EventChannel.h"

namespace graphview {

void EventChannel::publish(const Event& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(event);
}

std::optional<Event> EventChannel::tryReceive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    Event event = queue_.front();
    queue_.pop_front();
    return event;
}

std::vector<Event> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> events(queue_.begin(), queue_.end());
    queue_.clear();
    return events;
}

size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool EventChannel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

}  // namespace graphview
