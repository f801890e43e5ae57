#include "graphview/core/Graph.h"

#include <algorithm>

namespace graphview {

NodeId Graph::addNode() {
    return addNode(NodeData{});
}

NodeId Graph::addNode(Point location) {
    return addNode(NodeData{location});
}

NodeId Graph::addNode(Point location, const std::string& label) {
    return addNode(NodeData{location, label});
}

NodeId Graph::addNode(const NodeData& data) {
    NodeId id = static_cast<NodeId>(nodes_.size());

    NodeData nodeData = data;
    nodeData.id = id;
    nodes_.push_back(std::move(nodeData));
    nodeValid_.push_back(true);

    outEdges_[id] = {};
    inEdges_[id] = {};
    ++validNodeCount_;

    onGraphModified();
    return id;
}

void Graph::removeNode(NodeId id) {
    if (!hasNode(id)) return;

    // Remove all edges connected to this node
    for (EdgeId edgeId : getConnectedEdges(id)) {
        removeEdge(edgeId);
    }

    nodeValid_[id] = false;
    nodes_[id].payload.reset();
    outEdges_.erase(id);
    inEdges_.erase(id);
    --validNodeCount_;

    onGraphModified();
}

bool Graph::hasNode(NodeId id) const {
    return id < nodeValid_.size() && nodeValid_[id];
}

const NodeData& Graph::getNode(NodeId id) const {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return nodes_[id];
}

NodeData& Graph::getNode(NodeId id) {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return nodes_[id];
}

const NodeData* Graph::tryGetNode(NodeId id) const {
    return hasNode(id) ? &nodes_[id] : nullptr;
}

NodeData* Graph::tryGetNode(NodeId id) {
    return hasNode(id) ? &nodes_[id] : nullptr;
}

void Graph::setNodeLocation(NodeId id, Point location) {
    getNode(id).location = location;
    onGraphModified();
}

void Graph::setNodeLabel(NodeId id, const std::string& label) {
    getNode(id).label = label;
    onGraphModified();
}

EdgeId Graph::addEdge(NodeId from, NodeId to) {
    return addEdge(EdgeData{from, to});
}

EdgeId Graph::addEdge(NodeId from, NodeId to, const std::string& label) {
    return addEdge(EdgeData{from, to, label});
}

EdgeId Graph::addEdge(const EdgeData& data) {
    if (!hasNode(data.from) || !hasNode(data.to)) {
        throw std::invalid_argument("Invalid node ID in edge");
    }

    EdgeId id = static_cast<EdgeId>(edges_.size());

    EdgeData edgeData = data;
    edgeData.id = id;
    edgeData.order = buckets_[pairKey(data.from, data.to)].size();

    edges_.push_back(edgeData);
    edgeValid_.push_back(true);
    linkEdge(edgeData);

    onGraphModified();
    return id;
}

void Graph::removeEdge(EdgeId id) {
    if (!hasEdge(id)) return;

    const EdgeData edge = edges_[id];
    unlinkEdge(edge);
    edgeValid_[id] = false;
    edges_[id].payload.reset();

    // Keep the bucket dense: everything ranked above the removed edge moves down
    auto it = buckets_.find(pairKey(edge.from, edge.to));
    if (it != buckets_.end()) {
        for (EdgeId sibling : it->second) {
            if (edges_[sibling].order > edge.order) {
                --edges_[sibling].order;
            }
        }
    }

    onGraphModified();
}

bool Graph::hasEdge(EdgeId id) const {
    return id < edgeValid_.size() && edgeValid_[id];
}

const EdgeData& Graph::getEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return edges_[id];
}

EdgeData& Graph::getEdge(EdgeId id) {
    if (!hasEdge(id)) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return edges_[id];
}

const EdgeData* Graph::tryGetEdge(EdgeId id) const {
    return hasEdge(id) ? &edges_[id] : nullptr;
}

EdgeData* Graph::tryGetEdge(EdgeId id) {
    return hasEdge(id) ? &edges_[id] : nullptr;
}

std::optional<EdgeData> Graph::detachEdge(EdgeId id) {
    if (!hasEdge(id)) {
        return std::nullopt;
    }

    EdgeData edge = edges_[id];
    unlinkEdge(edge);
    edgeValid_[id] = false;

    onGraphModified();
    return edge;
}

bool Graph::reattachEdge(const EdgeData& data) {
    if (data.id >= edges_.size() || edgeValid_[data.id]) {
        return false;
    }
    if (!hasNode(data.from) || !hasNode(data.to)) {
        return false;
    }

    edges_[data.id] = data;
    edgeValid_[data.id] = true;
    linkEdge(data);

    onGraphModified();
    return true;
}

size_t Graph::nodeCount() const {
    return validNodeCount_;
}

size_t Graph::edgeCount() const {
    return validEdgeCount_;
}

std::vector<NodeId> Graph::nodes() const {
    std::vector<NodeId> result;
    result.reserve(validNodeCount_);
    for (size_t i = 0; i < nodeValid_.size(); ++i) {
        if (nodeValid_[i]) {
            result.push_back(static_cast<NodeId>(i));
        }
    }
    return result;
}

std::vector<EdgeId> Graph::edges() const {
    std::vector<EdgeId> result;
    result.reserve(validEdgeCount_);
    for (size_t i = 0; i < edgeValid_.size(); ++i) {
        if (edgeValid_[i]) {
            result.push_back(static_cast<EdgeId>(i));
        }
    }
    return result;
}

std::vector<EdgeId> Graph::outEdges(NodeId id) const {
    auto it = outEdges_.find(id);
    if (it == outEdges_.end()) return {};
    return it->second;
}

std::vector<EdgeId> Graph::inEdges(NodeId id) const {
    auto it = inEdges_.find(id);
    if (it == inEdges_.end()) return {};
    return it->second;
}

std::vector<EdgeId> Graph::getConnectedEdges(NodeId id) const {
    std::vector<EdgeId> result = outEdges(id);

    // Self-loops are already listed as outgoing
    for (EdgeId edgeId : inEdges(id)) {
        if (edges_[edgeId].from != id) {
            result.push_back(edgeId);
        }
    }
    return result;
}

size_t Graph::degree(NodeId id) const {
    size_t count = 0;
    if (auto it = outEdges_.find(id); it != outEdges_.end()) {
        count += it->second.size();
    }
    if (auto it = inEdges_.find(id); it != inEdges_.end()) {
        for (EdgeId edgeId : it->second) {
            if (edges_[edgeId].from != id) {
                ++count;
            }
        }
    }
    return count;
}

std::vector<EdgeId> Graph::edgesBetween(NodeId a, NodeId b) const {
    auto it = buckets_.find(pairKey(a, b));
    if (it == buckets_.end()) return {};
    return it->second;
}

size_t Graph::siblingCount(EdgeId id) const {
    if (!hasEdge(id)) return 0;
    const EdgeData& edge = edges_[id];
    auto it = buckets_.find(pairKey(edge.from, edge.to));
    return it == buckets_.end() ? 0 : it->second.size();
}

void Graph::clear() {
    nodes_.clear();
    edges_.clear();
    nodeValid_.clear();
    edgeValid_.clear();
    outEdges_.clear();
    inEdges_.clear();
    buckets_.clear();
    validNodeCount_ = 0;
    validEdgeCount_ = 0;

    onGraphModified();
}

uint64_t Graph::pairKey(NodeId a, NodeId b) {
    NodeId lo = std::min(a, b);
    NodeId hi = std::max(a, b);
    return (static_cast<uint64_t>(lo) << 32) | hi;
}

void Graph::linkEdge(const EdgeData& edge) {
    outEdges_[edge.from].push_back(edge.id);
    inEdges_[edge.to].push_back(edge.id);

    auto& bucket = buckets_[pairKey(edge.from, edge.to)];
    auto pos = std::lower_bound(bucket.begin(), bucket.end(), edge.order,
        [this](EdgeId sibling, size_t order) { return edges_[sibling].order < order; });
    bucket.insert(pos, edge.id);

    ++validEdgeCount_;
}

void Graph::unlinkEdge(const EdgeData& edge) {
    auto& outList = outEdges_[edge.from];
    outList.erase(std::remove(outList.begin(), outList.end(), edge.id), outList.end());

    auto& inList = inEdges_[edge.to];
    inList.erase(std::remove(inList.begin(), inList.end(), edge.id), inList.end());

    uint64_t key = pairKey(edge.from, edge.to);
    auto it = buckets_.find(key);
    if (it != buckets_.end()) {
        auto& bucket = it->second;
        bucket.erase(std::remove(bucket.begin(), bucket.end(), edge.id), bucket.end());
        if (bucket.empty()) {
            buckets_.erase(it);
        }
    }

    --validEdgeCount_;
}

}  // namespace graphview
