#include <gtest/gtest.h>
#include <graphview/core/GraphBuilder.h>

#include <string>

using namespace graphview;

namespace {

Topology makeTriangle() {
    Topology topology;
    topology.nodes = {std::any{}, std::any{}, std::any{}};
    topology.edges = {{0, 1, {}}, {1, 2, {}}, {2, 0, {}}};
    return topology;
}

}  // namespace

TEST(GraphBuilderTest, DefaultTransformScattersNodesAndLabelsByIndex) {
    GraphBuilder builder(42);
    Graph graph = builder.fromTopology(makeTriangle());

    ASSERT_EQ(graph.nodeCount(), 3);
    ASSERT_EQ(graph.edgeCount(), 3);

    for (NodeId id : graph.nodes()) {
        const NodeData& node = graph.getNode(id);
        EXPECT_EQ(node.label, std::to_string(id));
        EXPECT_GE(node.location.x, 0.0f);
        EXPECT_LT(node.location.x, DEFAULT_SPAWN_SIZE);
        EXPECT_GE(node.location.y, 0.0f);
        EXPECT_LT(node.location.y, DEFAULT_SPAWN_SIZE);
        EXPECT_FALSE(node.selected);
        EXPECT_FALSE(node.dragged);
    }
    EXPECT_FALSE(graph.isDirty());
}

TEST(GraphBuilderTest, SameSeedGivesSameLayout) {
    GraphBuilder first(7);
    GraphBuilder second(7);
    Graph a = first.fromTopology(makeTriangle());
    Graph b = second.fromTopology(makeTriangle());

    for (NodeId id : a.nodes()) {
        EXPECT_EQ(a.getNode(id).location, b.getNode(id).location);
    }
}

TEST(GraphBuilderTest, PayloadsAreKept) {
    Topology topology;
    topology.nodes = {std::any{std::string("alpha")}, std::any{17}};
    topology.edges = {{0, 1, std::any{2.5}}};

    GraphBuilder builder(1);
    Graph graph = builder.fromTopology(topology);

    EXPECT_EQ(std::any_cast<std::string>(graph.getNode(0).payload), "alpha");
    EXPECT_EQ(std::any_cast<int>(graph.getNode(1).payload), 17);
    EXPECT_DOUBLE_EQ(std::any_cast<double>(graph.getEdge(0).payload), 2.5);
}

TEST(GraphBuilderTest, ParallelEdgesInTopologyGetOrders) {
    Topology topology;
    topology.nodes = {std::any{}, std::any{}};
    topology.edges = {{0, 1, {}}, {1, 0, {}}, {0, 1, {}}, {0, 0, {}}};

    GraphBuilder builder(3);
    Graph graph = builder.fromTopology(topology);

    EXPECT_EQ(graph.getEdge(0).order, 0);
    EXPECT_EQ(graph.getEdge(1).order, 1);
    EXPECT_EQ(graph.getEdge(2).order, 2);
    EXPECT_EQ(graph.getEdge(3).order, 0);
    EXPECT_TRUE(graph.getEdge(3).isSelfLoop());
}

TEST(GraphBuilderTest, UndirectedKindIsCarriedOver) {
    Topology topology = makeTriangle();
    topology.kind = GraphKind::Undirected;

    GraphBuilder builder(5);
    Graph graph = builder.fromTopology(topology);
    EXPECT_FALSE(graph.isDirected());
}

TEST(GraphBuilderTest, EdgeToMissingNodeThrows) {
    Topology topology;
    topology.nodes = {std::any{}};
    topology.edges = {{0, 3, {}}};

    GraphBuilder builder(5);
    EXPECT_THROW(builder.fromTopology(topology), std::invalid_argument);
}

TEST(GraphBuilderTest, CustomNodeTransform) {
    GraphBuilder builder(11);
    builder.setNodeTransform([](size_t index, const std::any&) {
        NodeData data(Point{static_cast<float>(index) * 10.0f, 0.0f}, "n" + std::to_string(index));
        data.radius = 8.0f;
        return data;
    });

    Graph graph = builder.fromTopology(makeTriangle());

    EXPECT_EQ(graph.getNode(2).label, "n2");
    EXPECT_FLOAT_EQ(graph.getNode(2).location.x, 20.0f);
    EXPECT_FLOAT_EQ(graph.getNode(1).radius, 8.0f);
}

TEST(GraphBuilderTest, CustomEdgeTransformCannotRewireEndpoints) {
    GraphBuilder builder(11);
    builder.setEdgeTransform([](size_t index, const std::any&, size_t) {
        EdgeData data(99, 99, "e" + std::to_string(index));
        data.width = 4.0f;
        return data;
    });

    Graph graph = builder.fromTopology(makeTriangle());

    const EdgeData& edge = graph.getEdge(1);
    EXPECT_EQ(edge.from, 1);
    EXPECT_EQ(edge.to, 2);
    EXPECT_EQ(edge.label, "e1");
    EXPECT_FLOAT_EQ(edge.width, 4.0f);
}

TEST(GraphBuilderTest, EmptyTransformIsRejected) {
    GraphBuilder builder;
    EXPECT_THROW(builder.setNodeTransform(nullptr), std::invalid_argument);
    EXPECT_THROW(builder.setEdgeTransform(nullptr), std::invalid_argument);
}

TEST(GraphBuilderTest, ResetTransformsRestoresDefaults) {
    GraphBuilder builder(2);
    builder.setNodeTransform([](size_t, const std::any&) { return NodeData(Point{}, "custom"); });
    builder.resetTransforms();

    Graph graph = builder.fromTopology(makeTriangle());
    EXPECT_EQ(graph.getNode(0).label, "0");
}

TEST(GraphBuilderTest, AddNodeAfterRemovalUsesNextId) {
    GraphBuilder builder(9);
    Graph graph = builder.fromTopology(makeTriangle());
    graph.removeNode(1);

    NodeId id = builder.addNode(graph);
    EXPECT_EQ(id, 3);
    EXPECT_EQ(graph.getNode(id).label, "3");
}

TEST(GraphBuilderTest, AddEdgeAppendsToSiblings) {
    GraphBuilder builder(9);
    Graph graph = builder.fromTopology(makeTriangle());

    EdgeId id = builder.addEdge(graph, 1, 0, std::any{std::string("back")});
    EXPECT_EQ(graph.getEdge(id).order, 1);
    EXPECT_EQ(graph.siblingCount(id), 2);
    EXPECT_EQ(std::any_cast<std::string>(graph.getEdge(id).payload), "back");
}

TEST(GraphBuilderTest, DefaultEdgesTakeStyleDefaults) {
    SettingsStyle style;
    style.edgeWidth = 3.0f;
    style.edgeCurveSize = 12.0f;
    style.edgeTipSize = 9.0f;

    GraphBuilder builder(4);
    builder.setEdgeStyle(style);
    Graph graph = builder.fromTopology(makeTriangle());

    const EdgeData& edge = graph.getEdge(0);
    EXPECT_FLOAT_EQ(edge.width, 3.0f);
    EXPECT_FLOAT_EQ(edge.curveSize, 12.0f);
    EXPECT_FLOAT_EQ(edge.tipSize, 9.0f);
    EXPECT_FLOAT_EQ(edge.tipAngle, style.edgeTipAngle);
}
