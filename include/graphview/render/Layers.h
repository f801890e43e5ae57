#pragma once

#include "Shape.h"

#include <vector>

namespace graphview {

class IPainter;

/// Two-level paint queue. The base layer is painted first; within each
/// layer edges are painted before nodes.
class Layers {
public:
    void addEdgeShapes(std::vector<Shape> shapes, bool top);
    void addNodeShapes(std::vector<Shape> shapes, bool top);

    void paint(IPainter& painter) const;

    /// Shapes in paint order
    std::vector<Shape> ordered() const;

    size_t size() const;
    void clear();

private:
    struct Layer {
        std::vector<Shape> edges;
        std::vector<Shape> nodes;
    };

    static void append(std::vector<Shape>& dst, std::vector<Shape>&& src);

    Layer base_;
    Layer top_;
};

}  // namespace graphview
