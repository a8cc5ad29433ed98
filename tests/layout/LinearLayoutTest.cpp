#include <gtest/gtest.h>
#include <nodeweave/layout/LinearLayout.h>

#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace nodeweave;

namespace {

/// Node ids sorted by their coordinate along the layout axis.
std::vector<NodeId> axisOrder(const std::vector<NodePosition>& positions, bool horizontal) {
    std::vector<NodeId> order(positions.size());
    for (NodeId i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::sort(order.begin(), order.end(), [&](NodeId a, NodeId b) {
        return horizontal ? positions[a].pos.x < positions[b].pos.x
                          : positions[a].pos.y < positions[b].pos.y;
    });
    return order;
}

}  // namespace

class LinearLayoutTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Path 0-1-2-3 plus a parallel 1-2 edge.
        graph_ = LayoutGraph(4);
        graph_.addEdge(0, 1);
        graph_.addEdge(1, 2);
        graph_.addEdge(2, 3);
        graph_.addEdge(1, 2);
        positions_ = {NodePosition{Point{30.0f, 0.0f}}, NodePosition{Point{-20.0f, 40.0f}},
                      NodePosition{Point{100.0f, -60.0f}}, NodePosition{Point{0.0f, 10.0f}}};
    }

    LayoutGraph graph_;
    std::vector<NodePosition> positions_;
};

TEST_F(LinearLayoutTest, EdgeCurvatureFormula) {
    EXPECT_FLOAT_EQ(LinearLayout::edgeCurvature(2, 3, 0), 0.0f);
    EXPECT_FLOAT_EQ(LinearLayout::edgeCurvature(0, 3, 0), 100.0f);
    EXPECT_FLOAT_EQ(LinearLayout::edgeCurvature(3, 0, 2), 110.0f);

    LinearOptions options;
    options.spacing = 10.0f;
    options.duplicateOffset = 1.0f;
    EXPECT_FLOAT_EQ(LinearLayout::edgeCurvature(1, 4, 1, options), 21.0f);
}

TEST_F(LinearLayoutTest, PathIsLaidOutFromLeftEdge) {
    LinearLayout::apply(graph_, positions_, {0, 1, 2, 3});

    // Walk starts at node 0, the lowest id among the leaves.
    EXPECT_EQ(axisOrder(positions_, true), (std::vector<NodeId>{0, 1, 2, 3}));
    const float left = -20.0f;
    const float centerY = -10.0f;
    for (NodeId i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(positions_[i].pos.x, left + 20.0f + 90.0f * static_cast<float>(i));
        EXPECT_FLOAT_EQ(positions_[i].pos.y, centerY);
    }
}

TEST_F(LinearLayoutTest, ParallelEdgesGetDuplicateOffset) {
    LinearLayout::apply(graph_, positions_, {0, 1, 2, 3});

    EXPECT_FLOAT_EQ(graph_.getEdge(0).curvature, 0.0f);
    EXPECT_FLOAT_EQ(graph_.getEdge(1).curvature, 0.0f);
    EXPECT_FLOAT_EQ(graph_.getEdge(3).curvature, 5.0f);
}

TEST_F(LinearLayoutTest, CurvatureFollowsOrderDistance) {
    LayoutGraph graph(6);
    graph.addEdge(0, 1);
    graph.addEdge(1, 2);
    graph.addEdge(2, 0);
    graph.addEdge(2, 3);
    graph.addEdge(3, 4);
    graph.addEdge(4, 2);
    graph.addEdge(4, 5);
    graph.addEdge(0, 5);
    std::vector<NodePosition> positions(6);
    LinearOptions options;
    options.seed = 8;

    LinearLayout::apply(graph, positions, {0, 1, 2, 3, 4, 5}, options);

    const auto order = axisOrder(positions, true);
    std::map<NodeId, size_t> slot;
    for (size_t i = 0; i < order.size(); ++i) {
        slot[order[i]] = i;
    }
    for (const auto& edge : graph.edges()) {
        EXPECT_FLOAT_EQ(edge.curvature, LinearLayout::edgeCurvature(slot[edge.from], slot[edge.to], 0))
            << edge.from << "->" << edge.to;
    }
}

TEST_F(LinearLayoutTest, VerticalOrientation) {
    LinearOptions options;
    options.orientation = LayoutOrientation::Vertical;
    options.spacing = 10.0f;

    LinearLayout::apply(graph_, positions_, {0, 1, 2, 3}, options);

    EXPECT_EQ(axisOrder(positions_, false), (std::vector<NodeId>{0, 1, 2, 3}));
    for (NodeId i = 0; i < 4; ++i) {
        EXPECT_FLOAT_EQ(positions_[i].pos.x, 40.0f);
        EXPECT_FLOAT_EQ(positions_[i].pos.y, -60.0f + 10.0f + 30.0f * static_cast<float>(i));
    }
}

TEST_F(LinearLayoutTest, SmallSelectionUsesAllNodes) {
    LinearLayout::apply(graph_, positions_, {2});

    for (const auto& p : positions_) {
        EXPECT_FLOAT_EQ(p.pos.y, -10.0f);
    }
}

TEST_F(LinearLayoutTest, SmallComponentsKeepSelectionOrder) {
    LayoutGraph graph(5);
    graph.addEdge(3, 4);
    std::vector<NodePosition> positions(5);

    LinearLayout::apply(graph, positions, {0, 1, 2, 3, 4});

    EXPECT_EQ(axisOrder(positions, true), (std::vector<NodeId>{0, 1, 2, 3, 4}));
    EXPECT_FLOAT_EQ(graph.getEdge(0).curvature, 0.0f);
}

TEST_F(LinearLayoutTest, HiddenEdgesKeepCurvature) {
    LayoutGraph graph(4);
    graph.addEdge(0, 1);
    graph.addEdge(1, 2);
    graph.addEdge(2, 3);
    graph.addEdge(0, 3, 9, 42.0f);
    graph.hideTag(9);
    std::vector<NodePosition> positions(4);

    LinearLayout::apply(graph, positions, {0, 1, 2, 3});

    EXPECT_FLOAT_EQ(graph.getEdge(3).curvature, 42.0f);
}

TEST_F(LinearLayoutTest, PositionCountMismatchThrows) {
    positions_.push_back(NodePosition{});
    EXPECT_THROW(LinearLayout::apply(graph_, positions_, {0, 1, 2}), std::invalid_argument);
}
