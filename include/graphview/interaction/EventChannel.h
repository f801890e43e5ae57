#pragma once

#include "Event.h"

#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace graphview {

/// Unbounded queue sink. The widget publishes from the UI thread; any
/// thread may receive. Neither side blocks beyond the internal lock.
class EventChannel : public IEventSink {
public:
    void publish(const Event& event) override;

    /// Oldest pending event, if any
    std::optional<Event> tryReceive();

    /// All pending events in publish order
    std::vector<Event> drain();

    size_t size() const;
    bool empty() const;

private:
    mutable std::mutex mutex_;
    std::deque<Event> queue_;
};

}  // namespace graphview
