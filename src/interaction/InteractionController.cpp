#include "graphview/interaction/InteractionController.h"
#include "graphview/common/Logger.h"

#include <cmath>

namespace graphview {

InteractionController::InteractionController(const SettingsInteraction& interaction,
                                             const SettingsNavigation& navigation,
                                             const SettingsStyle& style)
    : interaction_(interaction)
    , navigation_(navigation)
    , style_(style) {}

InteractionOutcome InteractionController::handle(Graph& graph, ViewSession& session,
                                                 const ComputedState& computed,
                                                 const FrameInput& input) {
    InteractionOutcome out;
    Viewport& viewport = session.viewport;
    viewport.canvasRect = input.canvasRect;

    const float oldZoom = viewport.zoom;
    const Point oldPan = viewport.pan;

    // Updated by drag start so the same frame can already move the node
    std::optional<NodeId> dragged = computed.dragged;

    if (viewport.firstFrame || navigation_.fitToScreenEnabled) {
        handleFit(session, computed, out);
    } else {
        handleZoom(session, input);
        handleDragStart(graph, session, input, dragged, out);
        handleDragContinue(graph, session, input, dragged, out);
    }

    handleRelease(graph, session, input, dragged, out);
    handleClick(graph, session, computed, input);

    out.viewportChanged = viewport.zoom != oldZoom || viewport.pan != oldPan;
    return out;
}

std::optional<NodeId> InteractionController::nodeAt(const Graph& graph, const Viewport& viewport,
                                                    const Point& screenPoint) const {
    ShapeContext ctx{viewport, style_, graph.isDirected()};
    Point canvasPoint = viewport.screenToCanvas(screenPoint);

    for (NodeId id : graph.nodes()) {
        if (nodeShape().containsPoint(graph.getNode(id), canvasPoint, ctx)) {
            return id;
        }
    }
    return std::nullopt;
}

// =============================================================================
// Frame steps
// =============================================================================

void InteractionController::handleFit(ViewSession& session, const ComputedState& computed,
                                      InteractionOutcome& out) {
    Viewport& viewport = session.viewport;
    fitToScreen(viewport, computed.bounds, viewport.canvasRect);
    viewport.firstFrame = false;
    out.fitApplied = true;
}

void InteractionController::handleZoom(ViewSession& session, const FrameInput& input) {
    if (!navigation_.zoomAndPanEnabled) {
        return;
    }
    if (input.zoomDelta == 1.0f || !std::isfinite(input.zoomDelta)) {
        return;
    }

    // Only the direction of the gesture matters; each frame zooms by a fixed step.
    // A scale above 1 zooms in; taking the sign of (1 - delta) would invert the gesture.
    float direction = input.zoomDelta > 1.0f ? 1.0f : -1.0f;
    float step = navigation_.zoomSpeed * direction;

    Viewport& viewport = session.viewport;
    Point anchor = input.pointerPos.value_or(viewport.canvasRect.center());
    zoomAt(viewport, step, anchor);
}

void InteractionController::handleDragStart(Graph& graph, ViewSession& session,
                                            const FrameInput& input,
                                            std::optional<NodeId>& dragged,
                                            InteractionOutcome& out) {
    if (!input.dragStarted) {
        return;
    }

    // A drag that never saw its release ends here
    if (dragged) {
        if (NodeData* stale = graph.tryGetNode(*dragged)) {
            stale->dragged = false;
            publish(Event::nodeDragEnd(*dragged));
        }
        dragged.reset();
    }
    session.panning = false;

    std::optional<NodeId> hit;
    if (input.pointerPos) {
        hit = nodeAt(graph, session.viewport, *input.pointerPos);
    }

    if (hit && interaction_.draggingEnabled) {
        NodeData* node = graph.tryGetNode(*hit);
        if (!node) {
            LOG_WARN("Drag start on missing node {}", *hit);
            return;
        }
        node->dragged = true;
        dragged = hit;
        out.dragStarted = hit;
        publish(Event::nodeDragStart(*hit));
        return;
    }

    if (navigation_.zoomAndPanEnabled) {
        session.panning = true;
    }
}

void InteractionController::handleDragContinue(Graph& graph, ViewSession& session,
                                               const FrameInput& input,
                                               std::optional<NodeId> dragged,
                                               InteractionOutcome& out) {
    if (input.dragDelta.isZero() || !input.dragDelta.isFinite()) {
        return;
    }

    Viewport& viewport = session.viewport;

    if (dragged) {
        if (!interaction_.draggingEnabled) {
            return;
        }
        moveNode(graph, *dragged, input.dragDelta / viewport.zoom);
        out.nodesMoved = true;
        return;
    }

    if (session.panning && navigation_.zoomAndPanEnabled) {
        setPan(viewport, viewport.pan + input.dragDelta);
    }
}

void InteractionController::handleRelease(Graph& graph, ViewSession& session,
                                          const FrameInput& input,
                                          std::optional<NodeId> dragged,
                                          InteractionOutcome& out) {
    if (!input.dragReleased) {
        return;
    }

    session.panning = false;

    if (!dragged) {
        return;
    }

    NodeData* node = graph.tryGetNode(*dragged);
    if (!node) {
        LOG_WARN("Drag end on missing node {}", *dragged);
        return;
    }
    node->dragged = false;
    out.dragEnded = dragged;
    publish(Event::nodeDragEnd(*dragged));
}

void InteractionController::handleClick(Graph& graph, const ViewSession& session,
                                        const ComputedState& computed,
                                        const FrameInput& input) {
    if (!input.clicked && !input.doubleClicked) {
        return;
    }

    bool clickable = interaction_.clickingEnabled || interaction_.selectionAllowed();
    if (!clickable) {
        return;
    }

    std::optional<NodeId> hit;
    if (input.pointerPos) {
        hit = nodeAt(graph, session.viewport, *input.pointerPos);
    }

    if (!hit) {
        // Click on empty space
        if (interaction_.selectionAllowed()) {
            deselectAll(graph, computed);
        }
        return;
    }

    // The first click of a double click already arrived as a single click
    if (input.doubleClicked) {
        if (interaction_.clickingEnabled) {
            publish(Event::nodeDoubleClick(*hit));
        }
        return;
    }

    handleNodeClick(graph, *hit, computed);
}

void InteractionController::handleNodeClick(Graph& graph, NodeId id,
                                            const ComputedState& computed) {
    if (interaction_.clickingEnabled) {
        publish(Event::nodeClick(id));
    }

    if (!interaction_.selectionAllowed()) {
        return;
    }

    const NodeData* node = graph.tryGetNode(id);
    if (!node) {
        LOG_WARN("Click on missing node {}", id);
        return;
    }

    if (node->selected) {
        deselectNode(graph, id);
        return;
    }

    if (!interaction_.selectionMultiEnabled) {
        deselectAll(graph, computed);
    }

    selectNode(graph, id);
}

// =============================================================================
// Mutations
// =============================================================================

void InteractionController::selectNode(Graph& graph, NodeId id) {
    NodeData* node = graph.tryGetNode(id);
    if (!node) {
        LOG_WARN("Cannot select node {}: not found", id);
        return;
    }
    node->selected = true;
    publish(Event::nodeSelect(id));
}

void InteractionController::deselectNode(Graph& graph, NodeId id) {
    NodeData* node = graph.tryGetNode(id);
    if (!node) {
        LOG_WARN("Cannot deselect node {}: not found", id);
        return;
    }
    node->selected = false;
    publish(Event::nodeDeselect(id));
}

void InteractionController::deselectAll(Graph& graph, const ComputedState& computed) {
    for (NodeId id : computed.selectedNodes) {
        const NodeData* node = graph.tryGetNode(id);
        if (node && node->selected) {
            deselectNode(graph, id);
        }
    }
}

void InteractionController::moveNode(Graph& graph, NodeId id, Point canvasDelta) {
    NodeData* node = graph.tryGetNode(id);
    if (!node) {
        LOG_WARN("Cannot move node {}: not found", id);
        return;
    }
    node->location += canvasDelta;
    graph.markDirty();
    publish(Event::nodeMove(id, canvasDelta));
}

void InteractionController::fitToScreen(Viewport& viewport, const Bounds& bounds,
                                        const Rect& canvas) {
    const float oldZoom = viewport.zoom;
    const Point oldPan = viewport.pan;
    viewport.fitToScreen(bounds, canvas, navigation_.screenPadding);
    publishViewportChange(oldZoom, oldPan, viewport);
}

void InteractionController::zoomAt(Viewport& viewport, float delta, const Point& anchor) {
    const float oldZoom = viewport.zoom;
    const Point oldPan = viewport.pan;
    if (!viewport.zoomAt(delta, anchor)) {
        LOG_DEBUG("Rejected zoom step {} at zoom {}", delta, oldZoom);
        return;
    }
    publishViewportChange(oldZoom, oldPan, viewport);
}

void InteractionController::setPan(Viewport& viewport, Point pan) {
    const Point oldPan = viewport.pan;
    viewport.pan = pan;
    publishViewportChange(viewport.zoom, oldPan, viewport);
}

// =============================================================================
// Events
// =============================================================================

void InteractionController::publish(const Event& event) {
    if (sink_) {
        sink_->publish(event);
    }
}

void InteractionController::publishViewportChange(float oldZoom, Point oldPan,
                                                  const Viewport& viewport) {
    if (viewport.zoom != oldZoom) {
        publish(Event::zoom(viewport.zoom - oldZoom));
    }
    if (viewport.pan != oldPan) {
        publish(Event::pan(viewport.pan - oldPan, viewport.pan));
    }
}

const INodeShape& InteractionController::nodeShape() const {
    return nodeShape_ ? *nodeShape_ : defaultNodeShape_;
}

}  // namespace graphview
