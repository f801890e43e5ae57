#pragma once

#include "EdgeGeometry.h"
#include "Shape.h"

#include <vector>

namespace graphview {

/// An edge with the endpoint nodes it is drawn between
struct EdgeRenderInput {
    const EdgeData& edge;
    const NodeData& from;
    const NodeData& to;
    size_t siblingCount = 1;
};

/// Rendering and hit-testing strategy for edges
class IEdgeShape {
public:
    virtual ~IEdgeShape() = default;

    /// Called once per frame for every edge before any shapes are produced.
    /// Strategies that cache per-edge data refresh it here.
    virtual void refresh(const EdgeRenderInput& input, const ShapeContext& ctx) {
        (void)input;
        (void)ctx;
    }

    virtual std::vector<Shape> produceShapes(const EdgeRenderInput& input,
                                             const ShapeContext& ctx) const = 0;

    /// Hit test against a screen-space point
    virtual bool containsPoint(const EdgeRenderInput& input, const Point& screenPoint,
                               const ShapeContext& ctx) const = 0;
};

/// Straight, bowed or looped edge from the geometry engine, with an
/// arrowhead on directed graphs
class DefaultEdgeShape : public IEdgeShape {
public:
    /// @param hitTolerance Extra screen pixels around the stroke that still count as a hit
    explicit DefaultEdgeShape(float hitTolerance = 3.0f) : hitTolerance_(hitTolerance) {}

    std::vector<Shape> produceShapes(const EdgeRenderInput& input,
                                     const ShapeContext& ctx) const override;
    bool containsPoint(const EdgeRenderInput& input, const Point& screenPoint,
                       const ShapeContext& ctx) const override;

    EdgeGeometry computeGeometry(const EdgeRenderInput& input, const ShapeContext& ctx) const;

private:
    float hitTolerance_;
};

}  // namespace graphview
