#pragma once

#include "graphview/core/Graph.h"

#include <optional>
#include <vector>

namespace graphview {

/// Per-frame summary of the graph. Rebuilt at the start of every frame and
/// never stored; node and edge flags remain the source of truth.
struct ComputedState {
    std::optional<NodeId> dragged;
    std::vector<NodeId> selectedNodes;
    std::vector<EdgeId> selectedEdges;
    Bounds bounds;   ///< Node locations; zero box at the origin for an empty graph

    /// One pass over nodes and edges. Also writes each node's connection count.
    static ComputedState build(Graph& graph);

    bool isSelected(NodeId id) const;
};

}  // namespace graphview
