#include "graphview/layout/ForceLayout.h"
#include "graphview/common/Logger.h"

#include <vector>

namespace graphview {

namespace {

/// Detaches every self-loop on construction and restores them on scope exit
class SelfLoopGuard {
public:
    explicit SelfLoopGuard(Graph& graph) : graph_(graph) {
        for (EdgeId id : graph_.edges()) {
            if (graph_.getEdge(id).isSelfLoop()) {
                if (auto edge = graph_.detachEdge(id)) {
                    detached_.push_back(std::move(*edge));
                }
            }
        }
    }

    ~SelfLoopGuard() {
        for (const auto& edge : detached_) {
            if (!graph_.reattachEdge(edge)) {
                LOG_ERROR("Failed to restore self-loop edge {}", edge.id);
            }
        }
    }

    SelfLoopGuard(const SelfLoopGuard&) = delete;
    SelfLoopGuard& operator=(const SelfLoopGuard&) = delete;

private:
    Graph& graph_;
    std::vector<EdgeData> detached_;
};

}  // namespace

ForceLayout::ForceLayout(const SettingsSimulation& settings)
    : settings_(settings)
    , simulation_(settings) {}

void ForceLayout::setSettings(const SettingsSimulation& settings) {
    settings_ = settings;
    simulation_.setSettings(settings);
}

bool ForceLayout::step(Graph& graph) {
    if (converged_) {
        return false;
    }
    // Nothing to lay out; resumes once the graph has two nodes
    idle_ = graph.nodeCount() < 2;
    if (idle_) {
        return false;
    }

    {
        SelfLoopGuard guard(graph);
        lastDisplacement_ = simulation_.step(graph);
    }

    ++iteration_;
    if (iteration_ >= settings_.iterationCap) {
        converged_ = true;
        LOG_DEBUG("Force layout converged after {} iterations", iteration_);
    }

    return lastDisplacement_ > 0.0f;
}

void ForceLayout::onNodeDragged(NodeId id) {
    if (!settings_.restartOnDrag) {
        return;
    }
    LOG_DEBUG("Restarting force layout, node {} dragged", id);
    iteration_ = 0;
    converged_ = false;
}

void ForceLayout::reset() {
    idle_ = false;
    iteration_ = 0;
    converged_ = false;
    lastDisplacement_ = 0.0f;
    simulation_.reset();
}

}  // namespace graphview
