#include <gtest/gtest.h>
#include <graphview/view/ComputedState.h>

using namespace graphview;

TEST(ComputedStateTest, EmptyGraphHasZeroBoundsAtOrigin) {
    Graph graph;
    ComputedState state = ComputedState::build(graph);

    EXPECT_EQ(state.bounds, Bounds({0, 0}, {0, 0}));
    EXPECT_FALSE(state.dragged.has_value());
    EXPECT_TRUE(state.selectedNodes.empty());
    EXPECT_TRUE(state.selectedEdges.empty());
}

TEST(ComputedStateTest, BoundsCoverAllNodes) {
    Graph graph;
    graph.addNode(Point{-5, 10});
    graph.addNode(Point{20, -3});
    graph.addNode(Point{7, 40});

    ComputedState state = ComputedState::build(graph);

    EXPECT_EQ(state.bounds.min, Point(-5, -3));
    EXPECT_EQ(state.bounds.max, Point(20, 40));
}

TEST(ComputedStateTest, SingleNodeGivesPointBounds) {
    Graph graph;
    graph.addNode(Point{3, 4});

    ComputedState state = ComputedState::build(graph);
    EXPECT_TRUE(state.bounds.diagonal().isZero());
    EXPECT_EQ(state.bounds.center(), Point(3, 4));
}

TEST(ComputedStateTest, ConnectionsCountSelfLoopOnce) {
    Graph graph;
    NodeId a = graph.addNode();
    NodeId b = graph.addNode();
    NodeId c = graph.addNode();
    graph.addEdge(a, b);
    graph.addEdge(a, b);
    graph.addEdge(a, a);

    ComputedState::build(graph);

    EXPECT_EQ(graph.getNode(a).connections, 3);
    EXPECT_EQ(graph.getNode(b).connections, 2);
    EXPECT_EQ(graph.getNode(c).connections, 0);
}

TEST(ComputedStateTest, ConnectionsFollowEdgeRemoval) {
    Graph graph;
    NodeId a = graph.addNode();
    NodeId b = graph.addNode();
    EdgeId e = graph.addEdge(a, b);

    ComputedState::build(graph);
    EXPECT_EQ(graph.getNode(a).connections, 1);

    graph.removeEdge(e);
    ComputedState::build(graph);
    EXPECT_EQ(graph.getNode(a).connections, 0);
}

TEST(ComputedStateTest, CollectsSelectionAndDrag) {
    Graph graph;
    NodeId a = graph.addNode();
    NodeId b = graph.addNode();
    NodeId c = graph.addNode();
    EdgeId e = graph.addEdge(a, b);
    graph.getNode(a).selected = true;
    graph.getNode(c).selected = true;
    graph.getNode(b).dragged = true;
    graph.getEdge(e).selected = true;

    ComputedState state = ComputedState::build(graph);

    EXPECT_EQ(state.selectedNodes, (std::vector<NodeId>{a, c}));
    EXPECT_EQ(state.selectedEdges, (std::vector<EdgeId>{e}));
    ASSERT_TRUE(state.dragged.has_value());
    EXPECT_EQ(*state.dragged, b);
    EXPECT_TRUE(state.isSelected(a));
    EXPECT_FALSE(state.isSelected(b));
}
