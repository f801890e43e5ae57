#include "graphview/core/GraphBuilder.h"
#include "graphview/common/Logger.h"

#include <stdexcept>
#include <string>

namespace graphview {

GraphBuilder::GraphBuilder()
    : rng_(std::random_device{}()) {
    resetTransforms();
}

GraphBuilder::GraphBuilder(uint32_t seed)
    : rng_(seed) {
    resetTransforms();
}

void GraphBuilder::setNodeTransform(NodeTransform transform) {
    if (!transform) {
        throw std::invalid_argument("Node transform must be callable");
    }
    nodeTransform_ = std::move(transform);
}

void GraphBuilder::setEdgeTransform(EdgeTransform transform) {
    if (!transform) {
        throw std::invalid_argument("Edge transform must be callable");
    }
    edgeTransform_ = std::move(transform);
}

void GraphBuilder::resetTransforms() {
    nodeTransform_ = [this](size_t index, const std::any& payload) {
        return defaultNode(index, payload);
    };
    edgeTransform_ = [this](size_t index, const std::any& payload, size_t order) {
        return defaultEdge(index, payload, order);
    };
}

Graph GraphBuilder::fromTopology(const Topology& topology) {
    Graph graph(topology.kind);

    std::vector<NodeId> ids;
    ids.reserve(topology.nodes.size());
    for (size_t i = 0; i < topology.nodes.size(); ++i) {
        NodeData data = nodeTransform_(i, topology.nodes[i]);
        ids.push_back(graph.addNode(data));
    }

    for (size_t i = 0; i < topology.edges.size(); ++i) {
        const auto& edge = topology.edges[i];
        if (edge.from >= ids.size() || edge.to >= ids.size()) {
            throw std::invalid_argument("Topology edge " + std::to_string(i) +
                                        " refers to a missing node");
        }
        NodeId from = ids[edge.from];
        NodeId to = ids[edge.to];

        EdgeData data = edgeTransform_(i, edge.payload, nextOrder(graph, from, to));
        data.from = from;
        data.to = to;
        graph.addEdge(data);
    }

    LOG_DEBUG("Built graph with {} nodes and {} edges", graph.nodeCount(), graph.edgeCount());
    graph.markClean();
    return graph;
}

NodeId GraphBuilder::addNode(Graph& graph, const std::any& payload) {
    return graph.addNode(nodeTransform_(graph.nextNodeId(), payload));
}

EdgeId GraphBuilder::addEdge(Graph& graph, NodeId from, NodeId to, const std::any& payload) {
    EdgeData data = edgeTransform_(graph.edgeCount(), payload, nextOrder(graph, from, to));
    data.from = from;
    data.to = to;
    return graph.addEdge(data);
}

NodeData GraphBuilder::defaultNode(size_t index, const std::any& payload) {
    NodeData data(randomLocation(), std::to_string(index));
    data.payload = payload;
    return data;
}

EdgeData GraphBuilder::defaultEdge(size_t /*index*/, const std::any& payload, size_t order) const {
    EdgeData data;
    data.order = order;
    data.payload = payload;
    data.width = style_.edgeWidth;
    data.curveSize = style_.edgeCurveSize;
    data.tipSize = style_.edgeTipSize;
    data.tipAngle = style_.edgeTipAngle;
    return data;
}

Point GraphBuilder::randomLocation() {
    std::uniform_real_distribution<float> dist(0.0f, DEFAULT_SPAWN_SIZE);
    float x = dist(rng_);
    float y = dist(rng_);
    return {x, y};
}

size_t GraphBuilder::nextOrder(const Graph& graph, NodeId from, NodeId to) const {
    return graph.edgesBetween(from, to).size();
}

}  // namespace graphview
