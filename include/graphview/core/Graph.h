#pragma once

#include "Types.h"

#include <any>
#include <numbers>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace graphview {

/// Whether edge endpoints are ordered
enum class GraphKind {
    Directed,
    Undirected
};

struct NodeData {
    NodeId id = INVALID_NODE;
    Point location;              ///< Canvas space
    std::string label;
    float radius = 5.0f;         ///< Base radius before the connection weight is added
    bool selected = false;
    bool dragged = false;
    std::any payload;

    // Derived display state, rewritten every frame
    size_t connections = 0;
    Point screenLocation;
    float screenRadius = 0.0f;

    NodeData() = default;
    explicit NodeData(Point loc) : location(loc) {}
    NodeData(Point loc, std::string lbl) : location(loc), label(std::move(lbl)) {}
};

struct EdgeData {
    EdgeId id = INVALID_EDGE;
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;

    /// Rank among edges sharing the same unordered endpoint pair.
    /// Assigned by Graph::addEdge and only shifted down when a lower
    /// ranked sibling is removed.
    size_t order = 0;

    float width = 2.0f;
    float curveSize = 20.0f;
    float tipSize = 15.0f;
    float tipAngle = std::numbers::pi_v<float> / 6.0f;

    bool selected = false;
    std::string label;
    std::any payload;

    EdgeData() = default;
    EdgeData(NodeId f, NodeId t) : from(f), to(t) {}
    EdgeData(NodeId f, NodeId t, std::string lbl) : from(f), to(t), label(std::move(lbl)) {}

    bool isSelfLoop() const { return from == to; }
};

/// Multigraph of renderable nodes and edges.
///
/// Ids are slot indices and stay valid until the element is removed; they
/// are never reused by later insertions.
class Graph {
public:
    explicit Graph(GraphKind kind = GraphKind::Directed) : kind_(kind) {}
    virtual ~Graph() = default;

    GraphKind kind() const { return kind_; }
    bool isDirected() const { return kind_ == GraphKind::Directed; }

    // Node operations
    NodeId addNode();
    NodeId addNode(Point location);
    NodeId addNode(Point location, const std::string& label);
    virtual NodeId addNode(const NodeData& data);

    void removeNode(NodeId id);
    bool hasNode(NodeId id) const;

    // Node access API:
    // - getNode(): reference access for ids known to be valid (e.g. from nodes()).
    //   Throws std::out_of_range for unknown ids.
    // - tryGetNode(): pointer access for ids of uncertain validity (e.g. stored
    //   across frames). Returns nullptr for unknown ids.
    const NodeData& getNode(NodeId id) const;
    NodeData& getNode(NodeId id);
    const NodeData* tryGetNode(NodeId id) const;
    NodeData* tryGetNode(NodeId id);

    void setNodeLocation(NodeId id, Point location);
    void setNodeLabel(NodeId id, const std::string& label);

    // Edge operations
    EdgeId addEdge(NodeId from, NodeId to);
    EdgeId addEdge(NodeId from, NodeId to, const std::string& label);
    virtual EdgeId addEdge(const EdgeData& data);

    void removeEdge(EdgeId id);
    bool hasEdge(EdgeId id) const;

    const EdgeData& getEdge(EdgeId id) const;
    EdgeData& getEdge(EdgeId id);
    const EdgeData* tryGetEdge(EdgeId id) const;
    EdgeData* tryGetEdge(EdgeId id);

    /// Take an edge out of the graph without renumbering its siblings.
    /// The returned record can be handed back to reattachEdge() unchanged.
    std::optional<EdgeData> detachEdge(EdgeId id);

    /// Put a detached edge back under its original id and order.
    /// Returns false if the id slot is taken or an endpoint is gone.
    bool reattachEdge(const EdgeData& data);

    // Queries
    size_t nodeCount() const;
    size_t edgeCount() const;

    /// Id the next addNode() call will hand out
    NodeId nextNodeId() const { return static_cast<NodeId>(nodes_.size()); }

    std::vector<NodeId> nodes() const;
    std::vector<EdgeId> edges() const;

    std::vector<EdgeId> outEdges(NodeId id) const;
    std::vector<EdgeId> inEdges(NodeId id) const;

    /// Incident edges; a self-loop is listed once
    std::vector<EdgeId> getConnectedEdges(NodeId id) const;
    size_t degree(NodeId id) const;

    /// Edges between a and b in either direction, ordered by order index
    std::vector<EdgeId> edgesBetween(NodeId a, NodeId b) const;

    /// Number of edges sharing the unordered endpoint pair of this edge
    size_t siblingCount(EdgeId id) const;

    virtual void clear();

    // Dirty tracking for hosts that cache derived data
    bool isDirty() const { return dirty_; }
    void markDirty() { dirty_ = true; ++version_; }
    void markClean() { dirty_ = false; }
    uint64_t version() const { return version_; }

protected:
    static uint64_t pairKey(NodeId a, NodeId b);
    void linkEdge(const EdgeData& edge);
    void unlinkEdge(const EdgeData& edge);

    void onGraphModified() { markDirty(); }

    GraphKind kind_;

    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
    std::vector<bool> nodeValid_;
    std::vector<bool> edgeValid_;

    // Adjacency lists
    std::unordered_map<NodeId, std::vector<EdgeId>> outEdges_;
    std::unordered_map<NodeId, std::vector<EdgeId>> inEdges_;

    // Parallel edge buckets keyed by unordered endpoint pair, kept sorted by order
    std::unordered_map<uint64_t, std::vector<EdgeId>> buckets_;

    size_t validNodeCount_ = 0;
    size_t validEdgeCount_ = 0;

    bool dirty_ = false;
    uint64_t version_ = 0;
};

}  // namespace graphview
