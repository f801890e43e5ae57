#include "graphview/render/Drawer.h"
#include "graphview/render/IPainter.h"

namespace graphview {

Drawer::Drawer(const Graph& graph, const ShapeContext& ctx,
               const INodeShape& nodeShape, const IEdgeShape& edgeShape)
    : graph_(graph)
    , ctx_(ctx)
    , nodeShape_(nodeShape)
    , edgeShape_(edgeShape) {}

void Drawer::fillLayers(Layers& layers) const {
    fillEdges(layers);
    fillNodes(layers);
}

void Drawer::draw(IPainter& painter) const {
    Layers layers;
    fillLayers(layers);
    layers.paint(painter);
}

void Drawer::fillEdges(Layers& layers) const {
    for (EdgeId id : graph_.edges()) {
        const EdgeData& edge = graph_.getEdge(id);
        EdgeRenderInput input{edge, graph_.getNode(edge.from), graph_.getNode(edge.to),
                              graph_.siblingCount(id)};
        layers.addEdgeShapes(edgeShape_.produceShapes(input, ctx_), edge.selected);
    }
}

void Drawer::fillNodes(Layers& layers) const {
    for (NodeId id : graph_.nodes()) {
        const NodeData& node = graph_.getNode(id);
        layers.addNodeShapes(nodeShape_.produceShapes(node, ctx_), node.selected || node.dragged);
    }
}

}  // namespace graphview
