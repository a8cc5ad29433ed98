#include <gtest/gtest.h>
#include <nodeweave/force/ForceLayout.h>
#include <nodeweave/common/Logger.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

using namespace nodeweave;

class ForceLayoutTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::enableCapture(false);
        Logger::clearCapturedLogs();
    }

    ForceOptions options_;
};

TEST_F(ForceLayoutTest, EmptyGraphReturnsEmptyResult) {
    LayoutGraph graph;
    auto result = ForceLayout::layoutStep(graph, {}, options_, 10.0f);

    EXPECT_TRUE(result.positions.empty());
    EXPECT_FLOAT_EQ(result.maxDisplacement, 0.0f);
}

TEST_F(ForceLayoutTest, PositionCountMismatchThrows) {
    LayoutGraph graph(3);
    std::vector<NodePosition> positions(2);
    EXPECT_THROW(ForceLayout::layoutStep(graph, positions, options_, 10.0f), std::invalid_argument);
}

TEST_F(ForceLayoutTest, TwoIsolatedNodesPushApartSymmetrically) {
    LayoutGraph graph(2);
    std::vector<NodePosition> positions{NodePosition{Point{-10.0f, 0.0f}},
                                        NodePosition{Point{10.0f, 0.0f}}};

    auto result = ForceLayout::layoutStep(graph, positions, options_, 1000.0f);

    ASSERT_EQ(result.positions.size(), 2);
    EXPECT_LT(result.positions[0].pos.x, -10.0f);
    EXPECT_GT(result.positions[1].pos.x, 10.0f);
    EXPECT_FLOAT_EQ(result.positions[0].pos.x, -result.positions[1].pos.x);
    EXPECT_FLOAT_EQ(result.positions[0].pos.y, 0.0f);
    EXPECT_FLOAT_EQ(result.positions[0].vel.x, -result.positions[1].vel.x);
}

TEST_F(ForceLayoutTest, DisplacementClampedToTemperature) {
    LayoutGraph graph(2);
    std::vector<NodePosition> positions{NodePosition{Point{0.0f, 0.0f}},
                                        NodePosition{Point{1.0f, 0.0f}}};

    auto result = ForceLayout::layoutStep(graph, positions, options_, 10.0f);

    EXPECT_FLOAT_EQ(result.maxDisplacement, 10.0f);
    for (size_t i = 0; i < 2; ++i) {
        EXPECT_NEAR(result.positions[i].vel.length(), 10.0f, 1e-3f);
        EXPECT_NEAR(result.positions[i].pos.distanceTo(positions[i].pos), 10.0f, 1e-3f);
    }
}

TEST_F(ForceLayoutTest, LockedNodeKeepsPositionAndVelocity) {
    LayoutGraph graph(2);
    graph.addEdge(0, 1);
    std::vector<NodePosition> positions{NodePosition{Point{0.0f, 0.0f}, Point{1.0f, 2.0f}, true},
                                        NodePosition{Point{300.0f, 0.0f}}};

    auto result = ForceLayout::layoutStep(graph, positions, options_, 50.0f);

    EXPECT_EQ(result.positions[0].pos, positions[0].pos);
    EXPECT_EQ(result.positions[0].vel, positions[0].vel);
    EXPECT_TRUE(result.positions[0].locked);
    EXPECT_NE(result.positions[1].pos, positions[1].pos);
}

TEST_F(ForceLayoutTest, EdgePullsDistantNodesTogether) {
    LayoutGraph graph(2);
    graph.addEdge(0, 1);
    std::vector<NodePosition> positions{NodePosition{Point{-150.0f, 0.0f}},
                                        NodePosition{Point{150.0f, 0.0f}}};
    options_.gravityRadius = 50.0f;  // repulsion vanishes at this distance

    auto result = ForceLayout::layoutStep(graph, positions, options_, 100.0f);

    EXPECT_GT(result.positions[0].pos.x, -150.0f);
    EXPECT_LT(result.positions[1].pos.x, 150.0f);
}

TEST_F(ForceLayoutTest, HiddenEdgesAndSelfLoopsExertNoForce) {
    LayoutGraph plain(3);
    LayoutGraph tagged(3);
    tagged.addEdge(0, 1, 5);
    tagged.addEdge(2, 2);
    tagged.hideTag(5);

    std::vector<NodePosition> positions{NodePosition{Point{0.0f, 0.0f}},
                                        NodePosition{Point{120.0f, 10.0f}},
                                        NodePosition{Point{40.0f, 90.0f}}};

    auto expected = ForceLayout::layoutStep(plain, positions, options_, 30.0f);
    auto actual = ForceLayout::layoutStep(tagged, positions, options_, 30.0f);

    for (size_t i = 0; i < 3; ++i) {
        EXPECT_FLOAT_EQ(actual.positions[i].pos.x, expected.positions[i].pos.x);
        EXPECT_FLOAT_EQ(actual.positions[i].pos.y, expected.positions[i].pos.y);
    }
}

TEST_F(ForceLayoutTest, NonFinitePositionsSanitizedWithWarning) {
    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    LayoutGraph graph(2);
    std::vector<NodePosition> positions{NodePosition{Point{std::nanf(""), 0.0f}},
                                        NodePosition{Point{50.0f, 0.0f}}};

    auto result = ForceLayout::layoutStep(graph, positions, options_, 10.0f);

    for (const auto& p : result.positions) {
        EXPECT_TRUE(p.pos.isFinite());
        EXPECT_TRUE(p.vel.isFinite());
    }
    EXPECT_FALSE(Logger::getCapturedLogs("non-finite").empty());
}

TEST(ForceMathTest, SmoothInvert) {
    EXPECT_FLOAT_EQ(ForceLayout::smoothInvert(-1.0f), 1.0f);
    EXPECT_FLOAT_EQ(ForceLayout::smoothInvert(0.0f), 1.0f);
    EXPECT_FLOAT_EQ(ForceLayout::smoothInvert(0.5f), 0.5f);
    EXPECT_FLOAT_EQ(ForceLayout::smoothInvert(1.0f), 0.0f);
    EXPECT_GT(ForceLayout::smoothInvert(0.25f), ForceLayout::smoothInvert(0.75f));
}

TEST(ForceMathTest, RepulsionCutoffs) {
    const float radius = 100.0f;

    EXPECT_EQ(ForceLayout::repulsionForce(Point{5.0f, 5.0f}, Point{5.0f, 5.0f}, 1.0f, 10.0f, radius),
              Point{});
    EXPECT_EQ(ForceLayout::repulsionForce(Point{121.0f, 0.0f}, Point{}, 1.0f, 10.0f, radius), Point{});

    Point inside = ForceLayout::repulsionForce(Point{10.0f, 0.0f}, Point{}, 2.0f, 10.0f, radius);
    EXPECT_FLOAT_EQ(inside.x, 2.0f);
    EXPECT_FLOAT_EQ(inside.y, 0.0f);

    // Middle of the fade band keeps half the magnitude.
    Point fading = ForceLayout::repulsionForce(Point{110.0f, 0.0f}, Point{}, 1.0f, 110.0f, radius);
    EXPECT_NEAR(fading.x, 0.5f, 1e-5f);
}

TEST(ForceMathTest, ScatterIsSeededAndInsideArea) {
    auto a = ForceLayout::scatter(20, 10000.0f, 3);
    auto b = ForceLayout::scatter(20, 10000.0f, 3);

    ASSERT_EQ(a.size(), 20);
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].pos, b[i].pos);
        EXPECT_LE(std::abs(a[i].pos.x), 50.0f);
        EXPECT_LE(std::abs(a[i].pos.y), 50.0f);
    }
}

// ============== AnnealingSchedule ==============

TEST(AnnealingScheduleTest, CoolsGeometrically) {
    AnnealingSchedule schedule;
    EXPECT_FLOAT_EQ(schedule.temperature(), 100.0f);

    EXPECT_TRUE(schedule.advance(50.0f));
    EXPECT_FLOAT_EQ(schedule.temperature(), 98.0f);
    EXPECT_EQ(schedule.steps(), 1);
    EXPECT_FALSE(schedule.converged());
}

TEST(AnnealingScheduleTest, ConvergesOnlyWhenColdAndStill) {
    AnnealingSchedule::Options options;
    options.startTemperature = 0.4f;
    AnnealingSchedule schedule(options);

    EXPECT_TRUE(schedule.advance(5.0f));
    EXPECT_FALSE(schedule.advance(0.1f));
    EXPECT_TRUE(schedule.converged());

    schedule.reset();
    EXPECT_FLOAT_EQ(schedule.temperature(), 0.4f);
    EXPECT_EQ(schedule.steps(), 0);
    EXPECT_FALSE(schedule.converged());
}

TEST(AnnealingScheduleTest, StopsAtStepCap) {
    AnnealingSchedule::Options options;
    options.maxSteps = 3;
    AnnealingSchedule schedule(options);

    EXPECT_TRUE(schedule.advance(10.0f));
    EXPECT_TRUE(schedule.advance(10.0f));
    EXPECT_FALSE(schedule.advance(10.0f));
    EXPECT_FALSE(schedule.converged());
}

TEST(AnnealingScheduleTest, DrivesPathGraphToRest) {
    LayoutGraph graph(4);
    graph.addEdge(0, 1);
    graph.addEdge(1, 2);
    graph.addEdge(2, 3);

    auto positions = ForceLayout::scatter(graph.nodeCount(), 250000.0f, 5);
    AnnealingSchedule schedule;
    ForceOptions options;
    while (true) {
        auto step = ForceLayout::layoutStep(graph, positions, options, schedule.temperature());
        positions = std::move(step.positions);
        if (!schedule.advance(step.maxDisplacement)) {
            break;
        }
    }

    EXPECT_LE(schedule.steps(), 2000);
    for (const auto& p : positions) {
        EXPECT_TRUE(p.pos.isFinite());
    }
}
