#pragma once

#include "graphview/core/Types.h"

#include <optional>
#include <string>

namespace graphview {

enum class EventType {
    Pan,
    Zoom,
    NodeMove,
    NodeDragStart,
    NodeDragEnd,
    NodeSelect,
    NodeDeselect,
    NodeClick,
    NodeDoubleClick
};

/// Notification of a change made by the widget.
///
/// Which fields are meaningful depends on type:
/// - Pan: delta (pan difference), newPan
/// - Zoom: zoomDelta (new zoom minus old zoom)
/// - NodeMove: nodeId, delta (canvas-space displacement)
/// - all other types: nodeId
struct Event {
    EventType type = EventType::Pan;
    NodeId nodeId = INVALID_NODE;
    Point delta;
    Point newPan;
    float zoomDelta = 0.0f;

    static Event pan(Point diff, Point newPan);
    static Event zoom(float diff);
    static Event nodeMove(NodeId id, Point diff);
    static Event nodeDragStart(NodeId id);
    static Event nodeDragEnd(NodeId id);
    static Event nodeSelect(NodeId id);
    static Event nodeDeselect(NodeId id);
    static Event nodeClick(NodeId id);
    static Event nodeDoubleClick(NodeId id);

    bool operator==(const Event& o) const;
    bool operator!=(const Event& o) const { return !(*this == o); }
};

const char* eventTypeName(EventType type);
std::optional<EventType> eventTypeFromName(const std::string& name);

/// Human readable one-liner, e.g. "NodeMove{id=3, diff=(1, -2)}"
std::string toString(const Event& event);

/// JSON object tagged by "type" with only the fields that type carries
std::string eventToJson(const Event& event);

/// Parse eventToJson() output; nullopt on malformed input
std::optional<Event> eventFromJson(const std::string& json);

/// Receiver of widget events
class IEventSink {
public:
    virtual ~IEventSink() = default;
    virtual void publish(const Event& event) = 0;
};

}  // namespace graphview
