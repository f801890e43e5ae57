#pragma once

#include "graphview/core/Graph.h"

namespace graphview {

/// How node locations evolve between frames
class ILayoutMode {
public:
    virtual ~ILayoutMode() = default;

    virtual const char* name() const = 0;

    /// Advance the layout by one frame.
    /// @return true if any node location changed
    virtual bool step(Graph& graph) = 0;

    /// A node drag started
    virtual void onNodeDragged(NodeId id) { (void)id; }

    /// Start over from the current locations
    virtual void reset() {}

    /// Whether further frames will change the layout
    virtual bool isRunning() const = 0;
};

}  // namespace graphview
