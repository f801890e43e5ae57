#include <gtest/gtest.h>
#include <graphview/interaction/EventChannel.h>
#include <graphview/interaction/InteractionController.h>

#include <limits>

using namespace graphview;

/**
 * InteractionControllerTest
 *
 * Drives the controller frame by frame with synthetic pointer input and
 * checks node flags, viewport state and the emitted events.
 *
 * Two nodes joined by one edge, so each has one connection and a canvas
 * radius of 6. The viewport starts at zoom 2 with pan (50, 50): node a is
 * drawn at screen (50, 50), node b at (250, 50).
 */
class InteractionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        a_ = graph_.addNode(Point{0, 0}, "a");
        b_ = graph_.addNode(Point{100, 0}, "b");
        graph_.addEdge(a_, b_);

        SettingsInteraction interaction;
        interaction.draggingEnabled = true;
        SettingsNavigation navigation;
        navigation.zoomAndPanEnabled = true;
        navigation.fitToScreenEnabled = false;

        controller_.setInteraction(interaction);
        controller_.setNavigation(navigation);
        controller_.setEventSink(&events_);

        session_.viewport.zoom = 2.0f;
        session_.viewport.pan = {50, 50};
        session_.viewport.firstFrame = false;
    }

    FrameInput input() const {
        FrameInput in;
        in.canvasRect = {0, 0, 400, 400};
        return in;
    }

    InteractionOutcome run(const FrameInput& in) {
        ComputedState computed = ComputedState::build(graph_);
        return controller_.handle(graph_, session_, computed, in);
    }

    FrameInput dragStartAt(Point screen, Point delta) const {
        FrameInput in = input();
        in.pointerPos = screen;
        in.dragStarted = true;
        in.dragging = true;
        in.dragDelta = delta;
        return in;
    }

    Graph graph_;
    NodeId a_ = INVALID_NODE;
    NodeId b_ = INVALID_NODE;
    ViewSession session_;
    EventChannel events_;
    InteractionController controller_;
};

TEST_F(InteractionControllerTest, HitTestBoundaryIsInclusive) {
    ComputedState::build(graph_);

    // Exactly one canvas radius (6) to the right of a
    auto onEdge = controller_.nodeAt(graph_, session_.viewport, Point{62.0f, 50.0f});
    ASSERT_TRUE(onEdge.has_value());
    EXPECT_EQ(*onEdge, a_);

    EXPECT_FALSE(controller_.nodeAt(graph_, session_.viewport, Point{62.1f, 50.0f}).has_value());
}

TEST_F(InteractionControllerTest, HitTestReturnsLowestIdOnOverlap) {
    graph_.setNodeLocation(b_, Point{1, 0});
    ComputedState::build(graph_);

    auto hit = controller_.nodeAt(graph_, session_.viewport, Point{51.0f, 50.0f});
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, a_);
}

TEST_F(InteractionControllerTest, DragStartMovesNodeOnTheSameFrame) {
    InteractionOutcome out = run(dragStartAt({50, 50}, {4, 2}));

    EXPECT_TRUE(graph_.getNode(a_).dragged);
    ASSERT_TRUE(out.dragStarted.has_value());
    EXPECT_EQ(*out.dragStarted, a_);
    EXPECT_TRUE(out.nodesMoved);
    EXPECT_FALSE(session_.panning);

    // Screen delta divided by zoom
    EXPECT_EQ(graph_.getNode(a_).location, Point(2, 1));

    auto events = events_.drain();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0], Event::nodeDragStart(a_));
    EXPECT_EQ(events[1], Event::nodeMove(a_, {2, 1}));
}

TEST_F(InteractionControllerTest, DragContinueAndRelease) {
    run(dragStartAt({50, 50}, {0, 0}));
    events_.drain();

    FrameInput moving = input();
    moving.pointerPos = Point{56, 50};
    moving.dragging = true;
    moving.dragDelta = {6, 0};
    run(moving);

    EXPECT_EQ(graph_.getNode(a_).location, Point(3, 0));
    EXPECT_TRUE(graph_.getNode(a_).dragged);

    FrameInput release = input();
    release.pointerPos = Point{56, 50};
    release.dragReleased = true;
    InteractionOutcome out = run(release);

    EXPECT_FALSE(graph_.getNode(a_).dragged);
    ASSERT_TRUE(out.dragEnded.has_value());
    EXPECT_EQ(*out.dragEnded, a_);

    auto events = events_.drain();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0], Event::nodeMove(a_, {3, 0}));
    EXPECT_EQ(events[1], Event::nodeDragEnd(a_));
}

TEST_F(InteractionControllerTest, BackgroundDragPans) {
    run(dragStartAt({200, 300}, {10, -5}));

    EXPECT_TRUE(session_.panning);
    EXPECT_EQ(session_.viewport.pan, Point(60, 45));

    auto events = events_.drain();
    ASSERT_EQ(events.size(), 1);
    EXPECT_EQ(events[0], Event::pan({10, -5}, {60, 45}));

    FrameInput moving = input();
    moving.dragging = true;
    moving.dragDelta = {1, 1};
    InteractionOutcome out = run(moving);
    EXPECT_TRUE(out.viewportChanged);
    EXPECT_EQ(session_.viewport.pan, Point(61, 46));

    FrameInput release = input();
    release.dragReleased = true;
    run(release);
    EXPECT_FALSE(session_.panning);
}

TEST_F(InteractionControllerTest, DraggingDisabledPansInstead) {
    SettingsInteraction interaction;
    controller_.setInteraction(interaction);

    run(dragStartAt({50, 50}, {4, 4}));

    EXPECT_FALSE(graph_.getNode(a_).dragged);
    EXPECT_EQ(graph_.getNode(a_).location, Point(0, 0));
    EXPECT_TRUE(session_.panning);
    EXPECT_EQ(session_.viewport.pan, Point(54, 54));
}

TEST_F(InteractionControllerTest, NavigationDisabledIgnoresBackgroundDragAndZoom) {
    SettingsNavigation navigation;
    navigation.fitToScreenEnabled = false;
    controller_.setNavigation(navigation);

    FrameInput in = dragStartAt({200, 300}, {10, 10});
    in.zoomDelta = 1.5f;
    InteractionOutcome out = run(in);

    EXPECT_FALSE(session_.panning);
    EXPECT_FALSE(out.viewportChanged);
    EXPECT_FLOAT_EQ(session_.viewport.zoom, 2.0f);
    EXPECT_TRUE(events_.empty());
}

TEST_F(InteractionControllerTest, ZoomInKeepsPointerAnchor) {
    Point pointer{100, 100};
    Point canvasUnderPointer = session_.viewport.screenToCanvas(pointer);

    FrameInput in = input();
    in.pointerPos = pointer;
    in.zoomDelta = 1.2f;
    InteractionOutcome out = run(in);

    EXPECT_TRUE(out.viewportChanged);
    EXPECT_NEAR(session_.viewport.zoom, 2.2f, 1e-5f);
    Point back = session_.viewport.canvasToScreen(canvasUnderPointer);
    EXPECT_NEAR(back.x, pointer.x, 1e-3f);
    EXPECT_NEAR(back.y, pointer.y, 1e-3f);

    auto events = events_.drain();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0].type, EventType::Zoom);
    EXPECT_NEAR(events[0].zoomDelta, 0.2f, 1e-5f);
    EXPECT_EQ(events[1].type, EventType::Pan);
    EXPECT_NEAR(events[1].newPan.x, 45.0f, 1e-3f);
}

TEST_F(InteractionControllerTest, ZoomOutUsesFixedStep) {
    FrameInput in = input();
    in.pointerPos = Point{100, 100};
    in.zoomDelta = 0.5f;
    run(in);

    // Magnitude of the gesture does not matter, only its direction
    EXPECT_NEAR(session_.viewport.zoom, 1.8f, 1e-5f);
}

TEST_F(InteractionControllerTest, ZoomWithoutPointerAnchorsAtCanvasCenter) {
    Point center{200, 200};
    Point canvasUnderCenter = session_.viewport.screenToCanvas(center);

    FrameInput in = input();
    in.zoomDelta = 2.0f;
    run(in);

    Point back = session_.viewport.canvasToScreen(canvasUnderCenter);
    EXPECT_NEAR(back.x, center.x, 1e-3f);
    EXPECT_NEAR(back.y, center.y, 1e-3f);
}

TEST_F(InteractionControllerTest, FirstFrameFitsOnce) {
    session_.viewport.firstFrame = true;

    InteractionOutcome first = run(input());
    EXPECT_TRUE(first.fitApplied);
    EXPECT_FALSE(session_.viewport.firstFrame);

    Point center = session_.viewport.canvasToScreen(Point{50, 0});
    EXPECT_NEAR(center.x, 200.0f, 1e-3f);
    EXPECT_NEAR(center.y, 200.0f, 1e-3f);

    InteractionOutcome second = run(input());
    EXPECT_FALSE(second.fitApplied);
    EXPECT_FALSE(second.viewportChanged);
}

TEST_F(InteractionControllerTest, FitToScreenBypassesZoomAndDrag) {
    SettingsNavigation navigation;
    navigation.zoomAndPanEnabled = true;
    navigation.fitToScreenEnabled = true;
    controller_.setNavigation(navigation);

    FrameInput in = dragStartAt({50, 50}, {8, 8});
    in.zoomDelta = 1.5f;
    InteractionOutcome out = run(in);

    EXPECT_TRUE(out.fitApplied);
    EXPECT_FALSE(out.dragStarted.has_value());
    EXPECT_FALSE(graph_.getNode(a_).dragged);
    EXPECT_EQ(graph_.getNode(a_).location, Point(0, 0));
    EXPECT_FALSE(session_.panning);

    for (const Event& event : events_.drain()) {
        EXPECT_TRUE(event.type == EventType::Zoom || event.type == EventType::Pan);
    }

    // Refitting the same bounds is a no-op
    InteractionOutcome again = run(input());
    EXPECT_TRUE(again.fitApplied);
    EXPECT_FALSE(again.viewportChanged);
    EXPECT_TRUE(events_.empty());
}

TEST_F(InteractionControllerTest, ReleaseStillRunsWhileFitting) {
    graph_.getNode(a_).dragged = true;

    SettingsNavigation navigation;
    navigation.fitToScreenEnabled = true;
    controller_.setNavigation(navigation);

    FrameInput release = input();
    release.dragReleased = true;
    run(release);

    EXPECT_FALSE(graph_.getNode(a_).dragged);
    auto events = events_.drain();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back(), Event::nodeDragEnd(a_));
}

TEST_F(InteractionControllerTest, NewDragStartEndsStaleDrag) {
    graph_.getNode(b_).dragged = true;

    run(dragStartAt({50, 50}, {0, 0}));

    EXPECT_FALSE(graph_.getNode(b_).dragged);
    EXPECT_TRUE(graph_.getNode(a_).dragged);

    auto events = events_.drain();
    ASSERT_EQ(events.size(), 2);
    EXPECT_EQ(events[0], Event::nodeDragEnd(b_));
    EXPECT_EQ(events[1], Event::nodeDragStart(a_));
}

TEST_F(InteractionControllerTest, NonFiniteDragDeltaIsIgnored) {
    run(dragStartAt({50, 50}, {0, 0}));
    events_.drain();

    FrameInput moving = input();
    moving.dragging = true;
    moving.dragDelta = {std::numeric_limits<float>::infinity(), 0};
    InteractionOutcome out = run(moving);

    EXPECT_FALSE(out.nodesMoved);
    EXPECT_EQ(graph_.getNode(a_).location, Point(0, 0));
}

TEST_F(InteractionControllerTest, MoveUnknownNodeIsLoggedNotThrown) {
    EXPECT_NO_THROW(controller_.moveNode(graph_, 99, {1, 1}));
    EXPECT_NO_THROW(controller_.selectNode(graph_, 99));
    EXPECT_TRUE(events_.empty());
}

TEST_F(InteractionControllerTest, CanvasRectIsCopiedIntoViewport) {
    FrameInput in = input();
    in.canvasRect = {10, 20, 300, 200};
    run(in);
    EXPECT_EQ(session_.viewport.canvasRect, Rect(10, 20, 300, 200));
}
