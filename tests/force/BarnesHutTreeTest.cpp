#include <gtest/gtest.h>
#include <nodeweave/force/BarnesHutTree.h>
#include <nodeweave/common/Logger.h>

#include <cmath>
#include <limits>
#include <random>
#include <vector>

using namespace nodeweave;

namespace {

/// Inverse-distance push away from source, scaled by its mass.
Point inversePush(Point target, const WeightedPoint& source) {
    const Point dir = target - source.pos;
    const float d2 = dir.lengthSquared();
    if (d2 == 0.0f) {
        return {};
    }
    return dir * (source.mass / d2);
}

Point pairwise(Point target, const std::vector<WeightedPoint>& points) {
    Point acc;
    for (const auto& p : points) {
        acc += inversePush(target, p);
    }
    return acc;
}

std::vector<WeightedPoint> cluster(Point center, float spread, size_t count, std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(-spread, spread);
    std::vector<WeightedPoint> points;
    for (size_t i = 0; i < count; ++i) {
        points.emplace_back(center + Point{dist(rng), dist(rng)}, 1.0f);
    }
    return points;
}

}  // namespace

TEST(BarnesHutTreeTest, EmptyTreeAccumulatesZero) {
    BarnesHutTree tree;
    tree.build({});

    EXPECT_TRUE(tree.empty());
    Point f = tree.accumulate(Point{1.0f, 2.0f}, inversePush);
    EXPECT_EQ(f, Point{});
    EXPECT_FLOAT_EQ(tree.rootMass().mass, 0.0f);
}

TEST(BarnesHutTreeTest, ZeroThetaMatchesPairwiseSum) {
    std::mt19937 rng(7);
    std::uniform_real_distribution<float> dist(-200.0f, 200.0f);
    std::vector<WeightedPoint> points;
    for (int i = 0; i < 200; ++i) {
        points.emplace_back(Point{dist(rng), dist(rng)}, 1.0f + static_cast<float>(i % 3));
    }

    BarnesHutTree tree(0.0f);
    tree.build(points, 4);
    EXPECT_GT(tree.nodeCount(), 1u);

    for (size_t i = 0; i < points.size(); i += 17) {
        const Point target = points[i].pos;
        const Point exact = pairwise(target, points);
        const Point approx = tree.accumulate(target, inversePush);
        EXPECT_NEAR(approx.x, exact.x, 1e-3f * std::max(1.0f, std::abs(exact.x)));
        EXPECT_NEAR(approx.y, exact.y, 1e-3f * std::max(1.0f, std::abs(exact.y)));
    }
}

TEST(BarnesHutTreeTest, DefaultThetaWithinFivePercentOnClusters) {
    std::mt19937 rng(11);
    std::vector<WeightedPoint> points = cluster(Point{0.0f, 0.0f}, 20.0f, 60, rng);
    auto second = cluster(Point{1000.0f, 0.0f}, 20.0f, 60, rng);
    points.insert(points.end(), second.begin(), second.end());

    BarnesHutTree tree(0.5f);
    tree.build(points);

    for (Point target : {Point{500.0f, 300.0f}, Point{-400.0f, -50.0f}, Point{1000.0f, 400.0f}}) {
        const Point exact = pairwise(target, points);
        const Point approx = tree.accumulate(target, inversePush);
        EXPECT_LE((approx - exact).length(), 0.05f * exact.length());
    }
}

TEST(BarnesHutTreeTest, RootMassIsWeightedCentroid) {
    BarnesHutTree tree;
    tree.build({{Point{0.0f, 0.0f}, 1.0f}, {Point{10.0f, 0.0f}, 3.0f}, {Point{0.0f, 8.0f}, 4.0f}}, 1);

    WeightedPoint root = tree.rootMass();
    EXPECT_FLOAT_EQ(root.mass, 8.0f);
    EXPECT_NEAR(root.pos.x, 30.0f / 8.0f, 1e-5f);
    EXPECT_NEAR(root.pos.y, 32.0f / 8.0f, 1e-5f);
}

TEST(BarnesHutTreeTest, CoincidentPointsDoNotRecurseForever) {
    std::vector<WeightedPoint> points(500, WeightedPoint{Point{3.0f, 3.0f}, 1.0f});

    BarnesHutTree tree;
    tree.build(points, 2);

    EXPECT_EQ(tree.pointCount(), 500u);
    const Point f = tree.accumulate(Point{4.0f, 3.0f}, inversePush);
    EXPECT_NEAR(f.x, 500.0f, 1e-2f);
    EXPECT_NEAR(f.y, 0.0f, 1e-4f);
}

TEST(BarnesHutTreeTest, NonFinitePointsDroppedWithWarning) {
    Logger::enableCapture(true);
    Logger::clearCapturedLogs();

    const float inf = std::numeric_limits<float>::infinity();
    BarnesHutTree tree;
    tree.build({{Point{0.0f, 0.0f}, 1.0f},
                {Point{inf, 0.0f}, 1.0f},
                {Point{1.0f, std::nanf("")}, 1.0f},
                {Point{2.0f, 2.0f}, 1.0f}});

    EXPECT_EQ(tree.pointCount(), 2u);
    EXPECT_FALSE(Logger::getCapturedLogs("[warn]").empty());

    Logger::enableCapture(false);
    Logger::clearCapturedLogs();
}
