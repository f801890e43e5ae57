#pragma once

#include "graphview/config/Settings.h"
#include "graphview/core/Graph.h"

#include <unordered_map>

namespace graphview {

/// Fruchterman-Reingold solver advancing node locations one fixed step at a time.
///
/// Ideal distance k = C * sqrt(area / n) with the spawn square as area.
/// Every pair repels with k^2 / d, every edge attracts with d^2 / k.
/// Velocities integrate as v = (v + F * dt) * damping and the per-step
/// displacement is capped. Dragged nodes stay where the user holds them.
class ForceSimulation {
public:
    explicit ForceSimulation(const SettingsSimulation& settings = {});

    void setSettings(const SettingsSimulation& settings) { settings_ = settings; }
    const SettingsSimulation& settings() const { return settings_; }

    /// Advance one step. Returns the largest node displacement.
    /// @throws std::invalid_argument if the graph contains a self-loop
    float step(Graph& graph);

    /// Forget accumulated velocities
    void reset() { velocity_.clear(); }

    /// Ideal edge length for a graph of nodeCount nodes
    float idealDistance(size_t nodeCount) const;

private:
    SettingsSimulation settings_;
    std::unordered_map<NodeId, Point> velocity_;
};

}  // namespace graphview
