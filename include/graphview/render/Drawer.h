#pragma once

#include "EdgeShape.h"
#include "Layers.h"
#include "NodeShape.h"

namespace graphview {

class IPainter;

/// Turns the graph into layered shapes through the node and edge strategies.
/// Node screen state must be refreshed before drawing.
class Drawer {
public:
    Drawer(const Graph& graph, const ShapeContext& ctx,
           const INodeShape& nodeShape, const IEdgeShape& edgeShape);

    void fillLayers(Layers& layers) const;
    void draw(IPainter& painter) const;

private:
    void fillEdges(Layers& layers) const;
    void fillNodes(Layers& layers) const;

    const Graph& graph_;
    const ShapeContext& ctx_;
    const INodeShape& nodeShape_;
    const IEdgeShape& edgeShape_;
};

}  // namespace graphview
