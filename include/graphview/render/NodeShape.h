#pragma once

#include "Shape.h"
#include "graphview/core/Graph.h"

#include <vector>

namespace graphview {

/// Rendering and hit-testing strategy for nodes
class INodeShape {
public:
    virtual ~INodeShape() = default;

    /// Update derived display state of the node (screen location, radius)
    virtual void refresh(NodeData& node, const ShapeContext& ctx) const = 0;

    /// Primitives to paint, in screen space
    virtual std::vector<Shape> produceShapes(const NodeData& node, const ShapeContext& ctx) const = 0;

    /// Hit test against a canvas-space point
    virtual bool containsPoint(const NodeData& node, const Point& canvasPoint,
                               const ShapeContext& ctx) const = 0;
};

/// Radius of a node on screen, grown by its connection count
float screenRadius(const NodeData& node, float zoom, const SettingsStyle& style);

/// Filled circle; label beside it when the node is selected or dragged,
/// or always with SettingsStyle::labelsAlways
class DefaultNodeShape : public INodeShape {
public:
    void refresh(NodeData& node, const ShapeContext& ctx) const override;
    std::vector<Shape> produceShapes(const NodeData& node, const ShapeContext& ctx) const override;
    bool containsPoint(const NodeData& node, const Point& canvasPoint,
                       const ShapeContext& ctx) const override;
};

}  // namespace graphview
