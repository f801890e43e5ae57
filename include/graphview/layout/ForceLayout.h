#pragma once

#include "ForceSimulation.h"
#include "ILayoutMode.h"

namespace graphview {

/// Runs the force simulation for a bounded number of frames.
///
/// Self-loops are taken out of the graph for the duration of each solver
/// step and put back unchanged. Once the iteration cap is reached the
/// layout counts as converged and stays still until restarted. A graph
/// with fewer than two nodes leaves the layout idle without using up
/// iterations.
class ForceLayout : public ILayoutMode {
public:
    explicit ForceLayout(const SettingsSimulation& settings = {});

    const char* name() const override { return "force"; }
    bool step(Graph& graph) override;
    void onNodeDragged(NodeId id) override;
    void reset() override;
    bool isRunning() const override { return !converged_ && !idle_; }

    void setSettings(const SettingsSimulation& settings);
    const SettingsSimulation& settings() const { return settings_; }

    size_t iteration() const { return iteration_; }
    bool isConverged() const { return converged_; }

    /// Largest node displacement of the last step
    float lastDisplacement() const { return lastDisplacement_; }

private:
    SettingsSimulation settings_;
    ForceSimulation simulation_;
    size_t iteration_ = 0;
    bool converged_ = false;
    bool idle_ = false;
    float lastDisplacement_ = 0.0f;
};

}  // namespace graphview
