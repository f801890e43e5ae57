#pragma once

#include "Graph.h"
#include "graphview/config/Settings.h"

#include <any>
#include <cstdint>
#include <functional>
#include <random>
#include <vector>

namespace graphview {

/// Side length of the square new nodes are scattered in
constexpr float DEFAULT_SPAWN_SIZE = 250.0f;

/// Plain description of a graph before it becomes renderable
struct Topology {
    struct Edge {
        size_t from = 0;   ///< Index into nodes
        size_t to = 0;
        std::any payload;
    };

    GraphKind kind = GraphKind::Directed;
    std::vector<std::any> nodes;
    std::vector<Edge> edges;
};

/// Builds a Graph from a Topology, decorating every node and edge through
/// replaceable transforms.
class GraphBuilder {
public:
    /// (node index, payload) -> node record
    using NodeTransform = std::function<NodeData(size_t, const std::any&)>;
    /// (edge index, payload, order index) -> edge record
    using EdgeTransform = std::function<EdgeData(size_t, const std::any&, size_t)>;

    GraphBuilder();
    explicit GraphBuilder(uint32_t seed);

    // Default transforms are bound to this instance
    GraphBuilder(const GraphBuilder&) = delete;
    GraphBuilder& operator=(const GraphBuilder&) = delete;

    void setNodeTransform(NodeTransform transform);
    void setEdgeTransform(EdgeTransform transform);

    /// Restore the default transforms
    void resetTransforms();

    void seed(uint32_t value) { rng_.seed(value); }

    /// Width, curve size and tip of edges made by the default edge transform
    void setEdgeStyle(const SettingsStyle& style) { style_ = style; }

    /// Build the graph. Edges referring to node indices past the end
    /// throw std::invalid_argument.
    Graph fromTopology(const Topology& topology);

    /// Insert one node through the node transform
    NodeId addNode(Graph& graph, const std::any& payload = {});

    /// Insert one edge through the edge transform
    EdgeId addEdge(Graph& graph, NodeId from, NodeId to, const std::any& payload = {});

    /// Random location in [0, DEFAULT_SPAWN_SIZE) on both axes, label = index
    NodeData defaultNode(size_t index, const std::any& payload);

    /// Keeps the payload and the order index; style from setEdgeStyle()
    EdgeData defaultEdge(size_t index, const std::any& payload, size_t order) const;

private:
    Point randomLocation();
    size_t nextOrder(const Graph& graph, NodeId from, NodeId to) const;

    NodeTransform nodeTransform_;
    EdgeTransform edgeTransform_;
    std::mt19937 rng_;
    SettingsStyle style_;
};

}  // namespace graphview
