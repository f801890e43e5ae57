#include "graphview/interaction/Event.h"

#include <array>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace graphview {

namespace {

constexpr std::array<std::pair<EventType, const char*>, 9> kEventNames = {{
    {EventType::Pan, "Pan"},
    {EventType::Zoom, "Zoom"},
    {EventType::NodeMove, "NodeMove"},
    {EventType::NodeDragStart, "NodeDragStart"},
    {EventType::NodeDragEnd, "NodeDragEnd"},
    {EventType::NodeSelect, "NodeSelect"},
    {EventType::NodeDeselect, "NodeDeselect"},
    {EventType::NodeClick, "NodeClick"},
    {EventType::NodeDoubleClick, "NodeDoubleClick"},
}};

Event nodeEvent(EventType type, NodeId id) {
    Event e;
    e.type = type;
    e.nodeId = id;
    return e;
}

json pointToJson(const Point& p) {
    return json::array({p.x, p.y});
}

Point pointFromJson(const json& j) {
    return {j.at(0).get<float>(), j.at(1).get<float>()};
}

}  // namespace

Event Event::pan(Point diff, Point newPan) {
    Event e;
    e.type = EventType::Pan;
    e.delta = diff;
    e.newPan = newPan;
    return e;
}

Event Event::zoom(float diff) {
    Event e;
    e.type = EventType::Zoom;
    e.zoomDelta = diff;
    return e;
}

Event Event::nodeMove(NodeId id, Point diff) {
    Event e = nodeEvent(EventType::NodeMove, id);
    e.delta = diff;
    return e;
}

Event Event::nodeDragStart(NodeId id) { return nodeEvent(EventType::NodeDragStart, id); }
Event Event::nodeDragEnd(NodeId id) { return nodeEvent(EventType::NodeDragEnd, id); }
Event Event::nodeSelect(NodeId id) { return nodeEvent(EventType::NodeSelect, id); }
Event Event::nodeDeselect(NodeId id) { return nodeEvent(EventType::NodeDeselect, id); }
Event Event::nodeClick(NodeId id) { return nodeEvent(EventType::NodeClick, id); }
Event Event::nodeDoubleClick(NodeId id) { return nodeEvent(EventType::NodeDoubleClick, id); }

bool Event::operator==(const Event& o) const {
    if (type != o.type) return false;
    switch (type) {
        case EventType::Pan:
            return delta == o.delta && newPan == o.newPan;
        case EventType::Zoom:
            return zoomDelta == o.zoomDelta;
        case EventType::NodeMove:
            return nodeId == o.nodeId && delta == o.delta;
        default:
            return nodeId == o.nodeId;
    }
}

const char* eventTypeName(EventType type) {
    for (const auto& [t, name] : kEventNames) {
        if (t == type) return name;
    }
    return "Unknown";
}

std::optional<EventType> eventTypeFromName(const std::string& name) {
    for (const auto& [t, n] : kEventNames) {
        if (name == n) return t;
    }
    return std::nullopt;
}

std::string toString(const Event& event) {
    const char* name = eventTypeName(event.type);
    switch (event.type) {
        case EventType::Pan:
            return std::format("{}{{diff=({}, {}), newPan=({}, {})}}", name,
                               event.delta.x, event.delta.y, event.newPan.x, event.newPan.y);
        case EventType::Zoom:
            return std::format("{}{{diff={}}}", name, event.zoomDelta);
        case EventType::NodeMove:
            return std::format("{}{{id={}, diff=({}, {})}}", name,
                               event.nodeId, event.delta.x, event.delta.y);
        default:
            return std::format("{}{{id={}}}", name, event.nodeId);
    }
}

std::string eventToJson(const Event& event) {
    json j;
    j["type"] = eventTypeName(event.type);

    switch (event.type) {
        case EventType::Pan:
            j["diff"] = pointToJson(event.delta);
            j["newPan"] = pointToJson(event.newPan);
            break;
        case EventType::Zoom:
            j["diff"] = event.zoomDelta;
            break;
        case EventType::NodeMove:
            j["id"] = event.nodeId;
            j["diff"] = pointToJson(event.delta);
            break;
        default:
            j["id"] = event.nodeId;
            break;
    }

    return j.dump();
}

std::optional<Event> eventFromJson(const std::string& jsonStr) {
    try {
        json j = json::parse(jsonStr);

        auto type = eventTypeFromName(j.at("type").get<std::string>());
        if (!type) {
            return std::nullopt;
        }

        switch (*type) {
            case EventType::Pan:
                return Event::pan(pointFromJson(j.at("diff")), pointFromJson(j.at("newPan")));
            case EventType::Zoom:
                return Event::zoom(j.at("diff").get<float>());
            case EventType::NodeMove:
                return Event::nodeMove(j.at("id").get<NodeId>(), pointFromJson(j.at("diff")));
            default:
                return nodeEvent(*type, j.at("id").get<NodeId>());
        }
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

}  // namespace graphview
