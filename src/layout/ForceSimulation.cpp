#include "graphview/layout/ForceSimulation.h"
#include "graphview/core/GraphBuilder.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace graphview {

namespace {

// Below this distance two nodes count as coincident
constexpr float kMinDistance = 0.01f;
constexpr float kGoldenAngle = 2.39996323f;

/// Unit vector from a to b, or a fixed direction derived from the pair
/// when they sit on top of each other
Point separation(const Point& a, const Point& b, size_t i, size_t j, float& distance) {
    Point delta = b - a;
    distance = delta.length();
    if (distance >= kMinDistance && std::isfinite(distance)) {
        return delta / distance;
    }
    float angle = kGoldenAngle * static_cast<float>(i * 31 + j);
    distance = kMinDistance;
    return {std::cos(angle), std::sin(angle)};
}

}  // namespace

ForceSimulation::ForceSimulation(const SettingsSimulation& settings)
    : settings_(settings) {}

float ForceSimulation::idealDistance(size_t nodeCount) const {
    if (nodeCount == 0) return 0.0f;
    float area = DEFAULT_SPAWN_SIZE * DEFAULT_SPAWN_SIZE;
    return settings_.idealDistanceScale * std::sqrt(area / static_cast<float>(nodeCount));
}

float ForceSimulation::step(Graph& graph) {
    std::vector<NodeId> ids = graph.nodes();
    if (ids.size() < 2) {
        return 0.0f;
    }

    std::vector<EdgeId> edgeIds = graph.edges();
    for (EdgeId id : edgeIds) {
        if (graph.getEdge(id).isSelfLoop()) {
            throw std::invalid_argument("Force simulation cannot handle self-loop edge " +
                                        std::to_string(id));
        }
    }

    const size_t n = ids.size();
    const float k = idealDistance(n);
    const float kSquared = k * k;

    std::unordered_map<NodeId, size_t> index;
    std::vector<Point> positions(n);
    for (size_t i = 0; i < n; ++i) {
        index[ids[i]] = i;
        positions[i] = graph.getNode(ids[i]).location;
    }

    std::vector<Point> forces(n);

    // Repulsion between every pair
    for (size_t i = 0; i < n; ++i) {
        for (size_t j = i + 1; j < n; ++j) {
            float distance = 0.0f;
            Point dir = separation(positions[i], positions[j], ids[i], ids[j], distance);
            Point force = dir * (kSquared / distance);
            forces[i] -= force;
            forces[j] += force;
        }
    }

    // Attraction along edges
    for (EdgeId id : edgeIds) {
        const EdgeData& edge = graph.getEdge(id);
        size_t i = index.at(edge.from);
        size_t j = index.at(edge.to);
        float distance = 0.0f;
        Point dir = separation(positions[i], positions[j], edge.from, edge.to, distance);
        Point force = dir * (distance * distance / k);
        forces[i] += force;
        forces[j] -= force;
    }

    float maxMoved = 0.0f;
    for (size_t i = 0; i < n; ++i) {
        NodeData& node = graph.getNode(ids[i]);
        Point& velocity = velocity_[ids[i]];

        if (node.dragged) {
            velocity = {0, 0};
            continue;
        }

        velocity = (velocity + forces[i] * settings_.timeStep) * settings_.damping;
        if (!velocity.isFinite()) {
            velocity = {0, 0};
            continue;
        }

        Point displacement = velocity * settings_.timeStep;
        float length = displacement.length();
        if (length > settings_.maxDisplacement) {
            displacement = displacement * (settings_.maxDisplacement / length);
            length = settings_.maxDisplacement;
        }

        node.location += displacement;
        maxMoved = std::max(maxMoved, length);
    }

    if (maxMoved > 0.0f) {
        graph.markDirty();
    }

    // Drop velocities of nodes that no longer exist
    if (velocity_.size() > n) {
        for (auto it = velocity_.begin(); it != velocity_.end();) {
            it = index.count(it->first) ? std::next(it) : velocity_.erase(it);
        }
    }

    return maxMoved;
}

}  // namespace graphview
