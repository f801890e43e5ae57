#pragma once

#include "graphview/config/Settings.h"
#include "graphview/core/Graph.h"
#include "graphview/interaction/Event.h"
#include "graphview/interaction/FrameInput.h"
#include "graphview/interaction/InteractionController.h"
#include "graphview/layout/ILayoutMode.h"
#include "graphview/render/EdgeShape.h"
#include "graphview/render/Layers.h"
#include "graphview/render/NodeShape.h"
#include "graphview/view/ViewSession.h"

#include <memory>
#include <optional>

namespace graphview {

class IPainter;

struct FrameResult {
    /// The view is still changing; the host should schedule another frame
    bool requestRepaint = false;
    InteractionOutcome interaction;
    bool layoutMoved = false;
};

/// Interactive view over a Graph.
///
/// The view borrows the graph and mutates it during update(). Per-surface
/// state (viewport, pan gesture) is kept by the caller in a ViewSession.
///
/// Usage:
/// @code
///   GraphView view(graph);
///   view.withInteractions(interaction).withEvents(&channel);
///   auto result = view.update(session, input);
///   view.draw(session.viewport, painter);
/// @endcode
class GraphView {
public:
    explicit GraphView(Graph& graph);

    GraphView& withInteractions(const SettingsInteraction& settings);
    GraphView& withNavigations(const SettingsNavigation& settings);
    GraphView& withStyles(const SettingsStyle& settings);

    /// Switch to the force layout with these settings
    GraphView& withSimulation(const SettingsSimulation& settings);

    /// Replace the layout mode (StaticLayout by default)
    GraphView& withLayout(std::unique_ptr<ILayoutMode> layout);

    /// Events are published to sink, which must outlive the view. nullptr disables events.
    GraphView& withEvents(IEventSink* sink);

    GraphView& withNodeShape(std::unique_ptr<INodeShape> shape);
    GraphView& withEdgeShape(std::unique_ptr<IEdgeShape> shape);

    /// Run one frame of interaction and layout against session
    FrameResult update(ViewSession& session, const FrameInput& input);

    /// Paint the graph as of the last update()
    void draw(const Viewport& viewport, IPainter& painter) const;

    /// update() followed by draw()
    FrameResult frame(ViewSession& session, const FrameInput& input, IPainter& painter);

    void fillLayers(const Viewport& viewport, Layers& layers) const;

    std::optional<NodeId> nodeAt(const Viewport& viewport, const Point& screenPoint) const;

    /// First edge (by id) whose stroke passes near the screen point
    std::optional<EdgeId> edgeAt(const Viewport& viewport, const Point& screenPoint) const;

    /// Restore a session to its defaults
    static void resetSession(ViewSession& session) { session.reset(); }

    Graph& graph() { return graph_; }
    const Graph& graph() const { return graph_; }
    ILayoutMode& layout() { return *layout_; }
    const ILayoutMode& layout() const { return *layout_; }
    InteractionController& controller() { return controller_; }

    const SettingsInteraction& interactionSettings() const { return controller_.interaction(); }
    const SettingsNavigation& navigationSettings() const { return controller_.navigation(); }
    const SettingsStyle& styleSettings() const { return controller_.style(); }

private:
    ShapeContext context(const Viewport& viewport) const;
    void refreshShapes(const Viewport& viewport);

    Graph& graph_;
    InteractionController controller_;
    std::unique_ptr<ILayoutMode> layout_;
    std::unique_ptr<INodeShape> nodeShape_;
    std::unique_ptr<IEdgeShape> edgeShape_;
};

}  // namespace graphview
