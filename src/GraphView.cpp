#include "graphview/GraphView.h"
#include "graphview/common/Logger.h"
#include "graphview/layout/ForceLayout.h"
#include "graphview/layout/StaticLayout.h"
#include "graphview/render/Drawer.h"
#include "graphview/render/IPainter.h"
#include "graphview/view/ComputedState.h"

#include <stdexcept>

namespace graphview {

GraphView::GraphView(Graph& graph)
    : graph_(graph)
    , layout_(std::make_unique<StaticLayout>())
    , nodeShape_(std::make_unique<DefaultNodeShape>())
    , edgeShape_(std::make_unique<DefaultEdgeShape>()) {
    controller_.setNodeShape(nodeShape_.get());
}

GraphView& GraphView::withInteractions(const SettingsInteraction& settings) {
    controller_.setInteraction(settings);
    return *this;
}

GraphView& GraphView::withNavigations(const SettingsNavigation& settings) {
    controller_.setNavigation(settings);
    return *this;
}

GraphView& GraphView::withStyles(const SettingsStyle& settings) {
    controller_.setStyle(settings);
    return *this;
}

GraphView& GraphView::withSimulation(const SettingsSimulation& settings) {
    if (auto* force = dynamic_cast<ForceLayout*>(layout_.get())) {
        force->setSettings(settings);
        return *this;
    }
    layout_ = std::make_unique<ForceLayout>(settings);
    return *this;
}

GraphView& GraphView::withLayout(std::unique_ptr<ILayoutMode> layout) {
    if (!layout) {
        throw std::invalid_argument("Layout mode must not be null");
    }
    layout_ = std::move(layout);
    LOG_DEBUG("Layout mode set to '{}'", layout_->name());
    return *this;
}

GraphView& GraphView::withEvents(IEventSink* sink) {
    controller_.setEventSink(sink);
    return *this;
}

GraphView& GraphView::withNodeShape(std::unique_ptr<INodeShape> shape) {
    if (!shape) {
        throw std::invalid_argument("Node shape must not be null");
    }
    nodeShape_ = std::move(shape);
    controller_.setNodeShape(nodeShape_.get());
    return *this;
}

GraphView& GraphView::withEdgeShape(std::unique_ptr<IEdgeShape> shape) {
    if (!shape) {
        throw std::invalid_argument("Edge shape must not be null");
    }
    edgeShape_ = std::move(shape);
    return *this;
}

FrameResult GraphView::update(ViewSession& session, const FrameInput& input) {
    FrameResult result;

    ComputedState computed = ComputedState::build(graph_);
    result.interaction = controller_.handle(graph_, session, computed, input);

    if (result.interaction.dragStarted) {
        layout_->onNodeDragged(*result.interaction.dragStarted);
    }

    result.layoutMoved = layout_->step(graph_);

    refreshShapes(session.viewport);

    const auto& outcome = result.interaction;
    result.requestRepaint = layout_->isRunning() || result.layoutMoved ||
                            outcome.viewportChanged || outcome.nodesMoved ||
                            session.panning || computed.dragged.has_value() ||
                            outcome.dragStarted.has_value();
    return result;
}

void GraphView::draw(const Viewport& viewport, IPainter& painter) const {
    ShapeContext ctx = context(viewport);
    Drawer(graph_, ctx, *nodeShape_, *edgeShape_).draw(painter);
}

FrameResult GraphView::frame(ViewSession& session, const FrameInput& input, IPainter& painter) {
    FrameResult result = update(session, input);
    draw(session.viewport, painter);
    return result;
}

void GraphView::fillLayers(const Viewport& viewport, Layers& layers) const {
    ShapeContext ctx = context(viewport);
    Drawer(graph_, ctx, *nodeShape_, *edgeShape_).fillLayers(layers);
}

std::optional<NodeId> GraphView::nodeAt(const Viewport& viewport, const Point& screenPoint) const {
    return controller_.nodeAt(graph_, viewport, screenPoint);
}

std::optional<EdgeId> GraphView::edgeAt(const Viewport& viewport, const Point& screenPoint) const {
    ShapeContext ctx = context(viewport);
    for (EdgeId id : graph_.edges()) {
        const EdgeData& edge = graph_.getEdge(id);
        EdgeRenderInput input{edge, graph_.getNode(edge.from), graph_.getNode(edge.to),
                              graph_.siblingCount(id)};
        if (edgeShape_->containsPoint(input, screenPoint, ctx)) {
            return id;
        }
    }
    return std::nullopt;
}

ShapeContext GraphView::context(const Viewport& viewport) const {
    return ShapeContext{viewport, controller_.style(), graph_.isDirected()};
}

void GraphView::refreshShapes(const Viewport& viewport) {
    ShapeContext ctx = context(viewport);

    for (NodeId id : graph_.nodes()) {
        nodeShape_->refresh(graph_.getNode(id), ctx);
    }

    for (EdgeId id : graph_.edges()) {
        const EdgeData& edge = graph_.getEdge(id);
        EdgeRenderInput input{edge, graph_.getNode(edge.from), graph_.getNode(edge.to),
                              graph_.siblingCount(id)};
        edgeShape_->refresh(input, ctx);
    }
}

}  // namespace graphview
