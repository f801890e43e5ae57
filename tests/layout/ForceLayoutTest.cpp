#include <gtest/gtest.h>
#include <graphview/layout/ForceLayout.h>
#include <graphview/layout/StaticLayout.h>

using namespace graphview;

class ForceLayoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        a_ = graph_.addNode(Point{0, 0}, "a");
        b_ = graph_.addNode(Point{40, 10}, "b");
        c_ = graph_.addNode(Point{-20, 60}, "c");
        graph_.addEdge(a_, b_);
        graph_.addEdge(b_, c_);
    }

    Graph graph_;
    NodeId a_ = INVALID_NODE;
    NodeId b_ = INVALID_NODE;
    NodeId c_ = INVALID_NODE;
};

TEST_F(ForceLayoutTest, StepMovesNodes) {
    ForceLayout layout;
    EXPECT_TRUE(layout.isRunning());

    Point before = graph_.getNode(a_).location;
    EXPECT_TRUE(layout.step(graph_));
    EXPECT_NE(graph_.getNode(a_).location, before);
    EXPECT_EQ(layout.iteration(), 1);
    EXPECT_GT(layout.lastDisplacement(), 0.0f);
}

TEST_F(ForceLayoutTest, SelfLoopsSurviveSimulation) {
    EdgeId loop0 = graph_.addEdge(a_, a_, "first");
    EdgeId loop1 = graph_.addEdge(a_, a_, "second");

    ForceLayout layout;
    for (int i = 0; i < 5; ++i) {
        EXPECT_NO_THROW(layout.step(graph_));
    }

    ASSERT_TRUE(graph_.hasEdge(loop0));
    ASSERT_TRUE(graph_.hasEdge(loop1));
    EXPECT_EQ(graph_.getEdge(loop0).order, 0);
    EXPECT_EQ(graph_.getEdge(loop1).order, 1);
    EXPECT_EQ(graph_.getEdge(loop1).label, "second");
    EXPECT_EQ(graph_.edgeCount(), 4);
    EXPECT_EQ(graph_.degree(a_), 3);
}

TEST_F(ForceLayoutTest, IterationCapStopsTheLayout) {
    SettingsSimulation settings;
    settings.iterationCap = 3;
    ForceLayout layout(settings);

    for (int i = 0; i < 3; ++i) {
        layout.step(graph_);
    }
    EXPECT_TRUE(layout.isConverged());
    EXPECT_FALSE(layout.isRunning());

    Point frozen = graph_.getNode(b_).location;
    EXPECT_FALSE(layout.step(graph_));
    EXPECT_EQ(graph_.getNode(b_).location, frozen);
    EXPECT_EQ(layout.iteration(), 3);
}

TEST_F(ForceLayoutTest, DragRestartsConvergedLayout) {
    SettingsSimulation settings;
    settings.iterationCap = 1;
    ForceLayout layout(settings);

    layout.step(graph_);
    ASSERT_TRUE(layout.isConverged());

    layout.onNodeDragged(a_);
    EXPECT_TRUE(layout.isRunning());
    EXPECT_EQ(layout.iteration(), 0);
}

TEST_F(ForceLayoutTest, DragDoesNotRestartWhenDisabled) {
    SettingsSimulation settings;
    settings.iterationCap = 1;
    settings.restartOnDrag = false;
    ForceLayout layout(settings);

    layout.step(graph_);
    layout.onNodeDragged(a_);
    EXPECT_TRUE(layout.isConverged());
}

TEST_F(ForceLayoutTest, ResetStartsOver) {
    SettingsSimulation settings;
    settings.iterationCap = 2;
    ForceLayout layout(settings);

    layout.step(graph_);
    layout.step(graph_);
    ASSERT_FALSE(layout.isRunning());

    layout.reset();
    EXPECT_TRUE(layout.isRunning());
    EXPECT_EQ(layout.iteration(), 0);
    EXPECT_FLOAT_EQ(layout.lastDisplacement(), 0.0f);
}

TEST_F(ForceLayoutTest, SingleNodeDoesNotIterate) {
    Graph single;
    single.addNode(Point{1, 1});

    ForceLayout layout;
    EXPECT_FALSE(layout.step(single));
    EXPECT_EQ(layout.iteration(), 0);
    EXPECT_FALSE(layout.isRunning());
    EXPECT_FALSE(layout.isConverged());
}

TEST_F(ForceLayoutTest, IdleLayoutResumesWhenGraphGrows) {
    Graph graph;
    NodeId a = graph.addNode(Point{0, 0});

    ForceLayout layout;
    layout.step(graph);
    ASSERT_FALSE(layout.isRunning());

    NodeId b = graph.addNode(Point{10, 0});
    graph.addEdge(a, b);
    EXPECT_TRUE(layout.step(graph));
    EXPECT_TRUE(layout.isRunning());
    EXPECT_EQ(layout.iteration(), 1);
}

TEST(StaticLayoutTest, NeverMovesNodes) {
    Graph graph;
    NodeId a = graph.addNode(Point{0, 0});
    graph.addNode(Point{1, 0});

    StaticLayout layout;
    EXPECT_STREQ(layout.name(), "static");
    EXPECT_FALSE(layout.isRunning());
    EXPECT_FALSE(layout.step(graph));
    EXPECT_EQ(graph.getNode(a).location, Point(0, 0));
}
