#include <gtest/gtest.h>
#include <nodeweave/layout/CircularLayout.h>
#include <nodeweave/common/Logger.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>
#include <stdexcept>
#include <vector>

using namespace nodeweave;

namespace {

const std::vector<OrderEdge> kEightNodeEdges = {
    {6, 0}, {7, 0}, {7, 5}, {4, 2}, {0, 4}, {6, 1}, {0, 1}, {6, 2}, {3, 2}};

std::vector<NodePosition> gridPositions(size_t count) {
    std::vector<NodePosition> positions;
    for (size_t i = 0; i < count; ++i) {
        positions.emplace_back(Point{static_cast<float>(i % 4) * 100.0f,
                                     static_cast<float>(i / 4) * 100.0f});
    }
    return positions;
}

}  // namespace

// ============== OrderingUtils ==============

TEST(OrderingUtilsTest, FindComponents) {
    std::vector<OrderEdge> edges = {{1, 2}, {2, 3}, {4, 5}};
    auto components = OrderingUtils::findComponents(edges, {1, 2, 3, 4, 5, 6});

    ASSERT_EQ(components.size(), 3);
    EXPECT_EQ(components[0], (std::vector<NodeId>{1, 2, 3}));
    EXPECT_EQ(components[1], (std::vector<NodeId>{4, 5}));
    EXPECT_EQ(components[2], (std::vector<NodeId>{6}));
}

TEST(OrderingUtilsTest, LeastConnectedNode) {
    auto adjacency = OrderingUtils::buildAdjacency({{0, 1}, {0, 2}, {0, 3}, {2, 3}});
    EXPECT_EQ(OrderingUtils::leastConnectedNode(adjacency), 1u);
    EXPECT_THROW(OrderingUtils::leastConnectedNode({}), std::invalid_argument);
}

TEST(OrderingUtilsTest, RandomDfsVisitsComponentOnce) {
    auto adjacency = OrderingUtils::buildAdjacency(kEightNodeEdges);
    std::mt19937 rng(3);

    auto walk = OrderingUtils::randomDfs(adjacency, 3, rng);

    ASSERT_EQ(walk.size(), 8);
    EXPECT_EQ(walk.front(), 3u);
    std::vector<NodeId> sorted = walk;
    std::sort(sorted.begin(), sorted.end());
    std::vector<NodeId> expected(8);
    std::iota(expected.begin(), expected.end(), NodeId{0});
    EXPECT_EQ(sorted, expected);
}

TEST(OrderingUtilsTest, ValidSelectionAndEdgesWithin) {
    LayoutGraph graph(4);
    graph.addEdge(0, 1);
    graph.addEdge(1, 3);
    graph.addEdge(0, 3, 2);
    graph.hideTag(2);

    auto nodes = OrderingUtils::validSelection(graph, {3, 1, 9, 1, 0});
    EXPECT_EQ(nodes, (std::vector<NodeId>{0, 1, 3}));

    auto edges = OrderingUtils::edgesWithin(graph, {1, 3});
    ASSERT_EQ(edges.size(), 1);
    EXPECT_EQ(edges[0].from, 1u);
    EXPECT_EQ(edges[0].to, 3u);
}

// ============== Cost and genetic search ==============

TEST(CircularLayoutTest, CirclePositionsStartAtTop) {
    auto points = CircularLayout::circlePositions(Point{0.0f, 0.0f}, 10.0f, 4);

    ASSERT_EQ(points.size(), 4);
    EXPECT_NEAR(points[0].x, 0.0f, 1e-4f);
    EXPECT_NEAR(points[0].y, -10.0f, 1e-4f);
    EXPECT_NEAR(points[1].x, 10.0f, 1e-4f);
    EXPECT_NEAR(points[1].y, 0.0f, 1e-4f);
    EXPECT_NEAR(points[2].y, 10.0f, 1e-4f);
}

TEST(CircularLayoutTest, CrossingCount) {
    // Square 0-1-2-3 with both diagonals: one crossing, each diagonal spans 2.
    std::vector<OrderEdge> edges = {{0, 1}, {1, 2}, {2, 3}, {3, 0}, {0, 2}, {1, 3}};
    std::vector<NodeId> order = {0, 1, 2, 3};

    EXPECT_DOUBLE_EQ(CircularLayout::circularCost(order, edges), 4.0 + 4.0 + 1.0);
    EXPECT_DOUBLE_EQ(CircularLayout::circularCostPairwise(order, edges), 9.0);
}

TEST(CircularLayoutTest, SweeplineAgreesWithPairwise) {
    std::vector<NodeId> order(8);
    std::iota(order.begin(), order.end(), NodeId{0});
    std::mt19937 rng(99);

    for (int i = 0; i < 20; ++i) {
        EXPECT_DOUBLE_EQ(CircularLayout::circularCost(order, kEightNodeEdges),
                         CircularLayout::circularCostPairwise(order, kEightNodeEdges));
        std::shuffle(order.begin(), order.end(), rng);
    }
}

TEST(CircularLayoutTest, CostRejectsUnknownEndpoint) {
    EXPECT_THROW(CircularLayout::circularCost({0, 1}, {{0, 2}}), std::invalid_argument);
}

TEST(CircularLayoutTest, OrderCrossover) {
    auto child = CircularLayout::orderCrossover({0, 1, 2, 3, 4}, {4, 3, 2, 1, 0}, 1, 3);
    EXPECT_EQ(child, (std::vector<NodeId>{4, 1, 2, 3, 0}));

    EXPECT_THROW(CircularLayout::orderCrossover({0, 1}, {0, 1, 2}, 0, 1), std::invalid_argument);
    EXPECT_THROW(CircularLayout::orderCrossover({0, 1}, {1, 0}, 2, 1), std::invalid_argument);
}

TEST(CircularLayoutTest, GeneticOrderBeatsIdentity) {
    std::vector<NodeId> identity(8);
    std::iota(identity.begin(), identity.end(), NodeId{0});
    const double identityCost = CircularLayout::circularCost(identity, kEightNodeEdges);

    GeneticOptions options;
    options.populationSize = 100;
    options.generations = 200;
    options.crossoverRate = 0.8;
    options.mutationRate = 0.1;
    std::mt19937 rng(1);

    auto best = CircularLayout::geneticOrder(kEightNodeEdges, options, rng);

    ASSERT_EQ(best.size(), 8);
    const double bestCost = CircularLayout::circularCost(best, kEightNodeEdges);
    EXPECT_LT(bestCost, identityCost);
    EXPECT_DOUBLE_EQ(bestCost, CircularLayout::circularCostPairwise(best, kEightNodeEdges));
}

TEST(CircularLayoutTest, GeneticOrderCoversDisconnectedInput) {
    std::vector<OrderEdge> edges = {{0, 1}, {1, 2}, {5, 6}};
    std::mt19937 rng(4);

    auto order = CircularLayout::geneticOrder(edges, GeneticOptions{}, rng);

    std::sort(order.begin(), order.end());
    EXPECT_EQ(order, (std::vector<NodeId>{0, 1, 2, 5, 6}));
    EXPECT_TRUE(CircularLayout::geneticOrder({}, GeneticOptions{}, rng).empty());
}

// ============== apply ==============

class CircularApplyTest : public ::testing::Test {
protected:
    void SetUp() override {
        graph_ = LayoutGraph(8);
        for (const auto& edge : kEightNodeEdges) {
            graph_.addEdge(edge.from, edge.to);
        }
        positions_ = gridPositions(8);
    }

    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
    }

    LayoutGraph graph_;
    std::vector<NodePosition> positions_;
};

TEST_F(CircularApplyTest, PlacesSelectionOnCircle) {
    std::vector<NodeId> all(8);
    std::iota(all.begin(), all.end(), NodeId{0});
    const Rect bounds = OrderingUtils::boundsOf(positions_, all);
    const float radius = bounds.center().distanceTo(bounds.min);

    positions_[3].vel = Point{5.0f, 5.0f};
    CircularLayout::apply(graph_, positions_, all);

    for (const auto& p : positions_) {
        EXPECT_NEAR(p.pos.distanceTo(bounds.center()), radius, 1e-3f);
        EXPECT_EQ(p.vel, Point{});
    }
}

TEST_F(CircularApplyTest, SeedMakesPlacementRepeatable) {
    auto other = positions_;
    CircularOptions options;
    options.seed = 17;

    CircularLayout::apply(graph_, positions_, {0, 1, 2, 3, 4, 5, 6, 7}, options);
    CircularLayout::apply(graph_, other, {0, 1, 2, 3, 4, 5, 6, 7}, options);

    for (size_t i = 0; i < positions_.size(); ++i) {
        EXPECT_EQ(positions_[i].pos, other[i].pos);
    }
}

TEST_F(CircularApplyTest, SmallComponentsAndUnselectedNodesStay) {
    LayoutGraph graph(6);
    graph.addEdge(0, 1);
    graph.addEdge(1, 2);
    graph.addEdge(2, 0);
    graph.addEdge(3, 4);
    auto positions = gridPositions(6);
    const auto before = positions;

    CircularLayout::apply(graph, positions, {0, 1, 2, 3, 4});

    EXPECT_EQ(positions[3].pos, before[3].pos);
    EXPECT_EQ(positions[4].pos, before[4].pos);
    EXPECT_EQ(positions[5].pos, before[5].pos);
    EXPECT_NE(positions[0].pos, before[0].pos);
}

TEST_F(CircularApplyTest, FewerThanTwoValidNodesIsNoOp) {
    const auto before = positions_;
    CircularLayout::apply(graph_, positions_, {2, 42, 2});

    for (size_t i = 0; i < positions_.size(); ++i) {
        EXPECT_EQ(positions_[i].pos, before[i].pos);
    }
}

TEST_F(CircularApplyTest, CoincidentNodesUseFallbackRadius) {
    Logger::enableCapture(true);
    Logger::clearCapturedLogs();
    for (auto& p : positions_) {
        p.pos = Point{10.0f, 10.0f};
    }
    CircularOptions options;
    options.fallbackSpacing = 40.0f;

    CircularLayout::apply(graph_, positions_, {0, 1, 2, 3, 4, 5, 6, 7}, options);

    const float expected = 40.0f * 8.0f / (2.0f * 3.14159265f);
    for (const auto& p : positions_) {
        EXPECT_NEAR(p.pos.distanceTo(Point{10.0f, 10.0f}), expected, 1e-2f);
    }
    EXPECT_FALSE(Logger::getCapturedLogs("[warn]").empty());
}

TEST_F(CircularApplyTest, PositionCountMismatchThrows) {
    positions_.pop_back();
    EXPECT_THROW(CircularLayout::apply(graph_, positions_, {0, 1, 2}), std::invalid_argument);
}
