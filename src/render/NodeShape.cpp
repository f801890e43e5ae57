#include "graphview/render/NodeShape.h"

namespace graphview {

float screenRadius(const NodeData& node, float zoom, const SettingsStyle& style) {
    float radius = node.radius + static_cast<float>(node.connections) * style.edgeRadiusWeight;
    return radius * zoom;
}

void DefaultNodeShape::refresh(NodeData& node, const ShapeContext& ctx) const {
    node.screenLocation = ctx.viewport.canvasToScreen(node.location);
    node.screenRadius = screenRadius(node, ctx.viewport.zoom, ctx.style);
}

std::vector<Shape> DefaultNodeShape::produceShapes(const NodeData& node, const ShapeContext& ctx) const {
    std::vector<Shape> shapes;
    if (!node.screenLocation.isFinite()) {
        return shapes;
    }

    Color color = Colors::NODE;
    if (node.dragged) {
        color = Colors::NODE_DRAGGED;
    } else if (node.selected) {
        color = Colors::NODE_SELECTED;
    }
    shapes.push_back(Shape::circle(node.screenLocation, node.screenRadius, color));

    bool showLabel = ctx.style.labelsAlways || node.selected || node.dragged;
    if (showLabel && !node.label.empty()) {
        // Up and to the right of the circle
        Point anchor = node.screenLocation + Point{node.screenRadius, -2.0f * node.screenRadius};
        shapes.push_back(Shape::label(anchor, node.label, Colors::LABEL));
    }
    return shapes;
}

bool DefaultNodeShape::containsPoint(const NodeData& node, const Point& canvasPoint,
                                     const ShapeContext& ctx) const {
    float zoom = ctx.viewport.zoom;
    float radius = screenRadius(node, zoom, ctx.style) / zoom;
    return node.location.distanceTo(canvasPoint) <= radius;
}

}  // namespace graphview
