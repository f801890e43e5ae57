#pragma once

#include "Event.h"
#include "FrameInput.h"
#include "graphview/config/Settings.h"
#include "graphview/core/Graph.h"
#include "graphview/render/NodeShape.h"
#include "graphview/view/ComputedState.h"
#include "graphview/view/ViewSession.h"

#include <optional>

namespace graphview {

/// What the controller did during one frame
struct InteractionOutcome {
    bool fitApplied = false;
    bool viewportChanged = false;
    bool nodesMoved = false;
    std::optional<NodeId> dragStarted;
    std::optional<NodeId> dragEnded;
};

/// Pointer state machine: Idle, Dragging(node), Panning.
///
/// Dragging is read from the node's dragged flag through the computed
/// state; Panning lives in the view session. Each frame runs, in order:
/// fit-to-screen, zoom, drag start, drag continue, release, click.
/// A frame that fits the view skips zoom and the drag steps.
class InteractionController {
public:
    InteractionController() = default;
    InteractionController(const SettingsInteraction& interaction,
                          const SettingsNavigation& navigation,
                          const SettingsStyle& style);

    void setInteraction(const SettingsInteraction& settings) { interaction_ = settings; }
    void setNavigation(const SettingsNavigation& settings) { navigation_ = settings; }
    void setStyle(const SettingsStyle& settings) { style_ = settings; }

    const SettingsInteraction& interaction() const { return interaction_; }
    const SettingsNavigation& navigation() const { return navigation_; }
    const SettingsStyle& style() const { return style_; }

    /// Events go nowhere without a sink
    void setEventSink(IEventSink* sink) { sink_ = sink; }

    /// Hit-test strategy; nullptr restores the default circle test
    void setNodeShape(const INodeShape* shape) { nodeShape_ = shape; }

    InteractionOutcome handle(Graph& graph, ViewSession& session,
                              const ComputedState& computed, const FrameInput& input);

    /// First node (by id) containing the screen point
    std::optional<NodeId> nodeAt(const Graph& graph, const Viewport& viewport,
                                 const Point& screenPoint) const;

    // Programmatic counterparts of the pointer gestures. All of them log and
    // ignore ids that do not exist.
    void selectNode(Graph& graph, NodeId id);
    void deselectNode(Graph& graph, NodeId id);
    void deselectAll(Graph& graph, const ComputedState& computed);
    void moveNode(Graph& graph, NodeId id, Point canvasDelta);
    void fitToScreen(Viewport& viewport, const Bounds& bounds, const Rect& canvas);
    void zoomAt(Viewport& viewport, float delta, const Point& anchor);
    void setPan(Viewport& viewport, Point pan);

private:
    void handleFit(ViewSession& session, const ComputedState& computed, InteractionOutcome& out);
    void handleZoom(ViewSession& session, const FrameInput& input);
    void handleDragStart(Graph& graph, ViewSession& session, const FrameInput& input,
                         std::optional<NodeId>& dragged, InteractionOutcome& out);
    void handleDragContinue(Graph& graph, ViewSession& session, const FrameInput& input,
                            std::optional<NodeId> dragged, InteractionOutcome& out);
    void handleRelease(Graph& graph, ViewSession& session, const FrameInput& input,
                       std::optional<NodeId> dragged, InteractionOutcome& out);
    void handleClick(Graph& graph, const ViewSession& session, const ComputedState& computed,
                     const FrameInput& input);
    void handleNodeClick(Graph& graph, NodeId id, const ComputedState& computed);

    void publish(const Event& event);
    void publishViewportChange(float oldZoom, Point oldPan, const Viewport& viewport);

    const INodeShape& nodeShape() const;

    SettingsInteraction interaction_;
    SettingsNavigation navigation_;
    SettingsStyle style_;

    IEventSink* sink_ = nullptr;
    const INodeShape* nodeShape_ = nullptr;
    DefaultNodeShape defaultNodeShape_;
};

}  // namespace graphview
