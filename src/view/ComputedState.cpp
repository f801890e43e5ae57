#include "graphview/view/ComputedState.h"
#include "graphview/common/Logger.h"

#include <algorithm>

namespace graphview {

ComputedState ComputedState::build(Graph& graph) {
    ComputedState state;

    for (NodeId id : graph.nodes()) {
        NodeData& node = graph.getNode(id);
        node.connections = graph.degree(id);

        state.bounds.include(node.location);

        if (node.selected) {
            state.selectedNodes.push_back(id);
        }
        if (node.dragged) {
            if (!state.dragged) {
                state.dragged = id;
            } else {
                LOG_WARN("Node {} is flagged as dragged while node {} already is; ignoring it",
                         id, *state.dragged);
            }
        }
    }

    for (EdgeId id : graph.edges()) {
        if (graph.getEdge(id).selected) {
            state.selectedEdges.push_back(id);
        }
    }

    if (!state.bounds.isValid()) {
        state.bounds = Bounds{{0, 0}, {0, 0}};
    }

    return state;
}

bool ComputedState::isSelected(NodeId id) const {
    return std::find(selectedNodes.begin(), selectedNodes.end(), id) != selectedNodes.end();
}

}  // namespace graphview
