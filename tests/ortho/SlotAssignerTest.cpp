#include <gtest/gtest.h>
#include <nodeweave/ortho/SlotAssigner.h>
#include <nodeweave/ortho/OrthogonalRouter.h>
#include "ortho/ChannelLegs.h"

#include <stdexcept>
#include <vector>

using namespace nodeweave;
using namespace nodeweave::ortho_detail;

namespace {

ChannelLeg makeLeg(size_t start, size_t end, size_t distance, PortSides sides) {
    ChannelLeg leg;
    leg.startConnector = start;
    leg.endConnector = end;
    leg.circularDistance = distance;
    leg.portSides = sides;
    leg.routeOrder = 0;
    return leg;
}

std::vector<Rect> fiveBoxes() {
    return {Rect::fromCenterSize({20.0f, 20.0f}, {30.0f, 10.0f}),
            Rect::fromCenterSize({70.0f, 22.0f}, {30.0f, 10.0f}),
            Rect::fromCenterSize({20.0f, 38.0f}, {25.0f, 10.0f}),
            Rect::fromCenterSize({70.0f, 40.0f}, {35.0f, 10.0f}),
            Rect::fromCenterSize({40.0f, 60.0f}, {55.0f, 10.0f})};
}

std::vector<OrthoEdge> fiveEdges() {
    return {{0, 1}, {0, 3}, {0, 4}, {2, 3}, {1, 4}, {1, 3}, {2, 4}};
}

void expectPolyline(const std::vector<Point>& actual, const std::vector<Point>& expected) {
    ASSERT_EQ(actual.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_NEAR(actual[i].x, expected[i].x, 1e-3f) << "point " << i;
        EXPECT_NEAR(actual[i].y, expected[i].y, 1e-3f) << "point " << i;
    }
}

}  // namespace

// ============== Legs ==============

TEST(ChannelLegTest, BothSideLegsOrderByCircularDistance) {
    const ChannelLeg leg1 = makeLeg(0, 2, 2, PortSides::BothLeftOrTop);
    const ChannelLeg leg2 = makeLeg(1, 3, 3, PortSides::BothLeftOrTop);
    const ChannelLeg leg3 = makeLeg(1, 3, 1, PortSides::BothRightOrBottom);
    const ChannelLeg leg4 = makeLeg(1, 3, 1, PortSides::BothRightOrBottom);

    EXPECT_EQ(compareLegs(leg1, leg2), -1);
    EXPECT_EQ(compareLegs(leg2, leg3), -1);
    EXPECT_EQ(compareLegs(leg3, leg4), 0);
}

TEST(ChannelLegTest, CrossUpLegsOrderBySmallerThenLargerConnector) {
    const ChannelLeg leg5 = makeLeg(3, 1, 1, PortSides::CrossUp);
    const ChannelLeg leg6 = makeLeg(3, 2, 1, PortSides::CrossUp);
    const ChannelLeg leg7 = makeLeg(4, 2, 1, PortSides::CrossUp);
    const ChannelLeg leg8 = makeLeg(2, 8, 1, PortSides::CrossUp);
    const ChannelLeg leg9 = makeLeg(2, 9, 1, PortSides::CrossUp);

    EXPECT_EQ(compareLegs(leg5, leg6), -1);
    EXPECT_EQ(relativeOrder(leg5, leg6), -1);
    EXPECT_EQ(compareLegs(leg6, leg7), -1);
    EXPECT_EQ(compareLegs(leg9, leg8), 1);
}

TEST(ChannelLegTest, CrossDownLegsOrderByLargerConnectorDescending) {
    const ChannelLeg leg10 = makeLeg(3, 1, 1, PortSides::CrossDown);
    const ChannelLeg leg11 = makeLeg(3, 2, 1, PortSides::CrossDown);
    const ChannelLeg leg12 = makeLeg(9, 14, 1, PortSides::CrossDown);
    const ChannelLeg leg13 = makeLeg(9, 15, 1, PortSides::CrossDown);
    const ChannelLeg leg14 = makeLeg(10, 15, 1, PortSides::CrossDown);

    EXPECT_EQ(compareLegs(leg10, leg11), 1);
    EXPECT_EQ(compareLegs(leg13, leg12), -1);
    EXPECT_EQ(compareLegs(leg14, leg13), -1);
}

TEST(ChannelLegTest, RightOrBottomLegsFlipRouteOrder) {
    const ChannelLeg leg15 = makeLeg(1, 3, 2, PortSides::BothRightOrBottom);
    const ChannelLeg leg16 = makeLeg(1, 4, 3, PortSides::BothRightOrBottom);

    EXPECT_EQ(compareLegs(leg15, leg16), -1);
    EXPECT_EQ(relativeOrder(leg15, leg16), 1);
}

TEST(ChannelLegTest, DifferentPortSidesOrderByKind) {
    const ChannelLeg up = makeLeg(0, 1, 1, PortSides::CrossUp);
    const ChannelLeg down = makeLeg(0, 1, 1, PortSides::CrossDown);
    EXPECT_EQ(relativeOrder(up, down), -1);
    EXPECT_EQ(relativeOrder(down, up), 1);
}

TEST(ChannelLegTest, PortSidesFromWalls) {
    EXPECT_EQ(portSidesFrom(Side::Left, Side::Left, 0, 1), PortSides::BothLeftOrTop);
    EXPECT_EQ(portSidesFrom(Side::Right, Side::Right, 0, 1), PortSides::BothRightOrBottom);
    EXPECT_EQ(portSidesFrom(Side::Top, Side::Top, 0, 1), PortSides::BothLeftOrTop);
    EXPECT_EQ(portSidesFrom(Side::Bottom, Side::Bottom, 0, 1), PortSides::BothRightOrBottom);

    EXPECT_EQ(portSidesFrom(Side::Left, Side::Right, 1, 0), PortSides::CrossUp);
    EXPECT_EQ(portSidesFrom(Side::Right, Side::Left, 1, 0), PortSides::CrossDown);
    EXPECT_EQ(portSidesFrom(Side::Left, Side::Right, 0, 1), PortSides::CrossDown);
    EXPECT_EQ(portSidesFrom(Side::Right, Side::Left, 0, 1), PortSides::CrossUp);

    EXPECT_THROW(portSidesFrom(Side::Left, Side::Top, 0, 1), std::logic_error);
}

TEST(ChannelLegTest, SideForBend) {
    EXPECT_EQ(sideForBend(BendDirection::UpRight, Orientation::Vertical), Side::Right);
    EXPECT_EQ(sideForBend(BendDirection::DownRight, Orientation::Vertical), Side::Right);
    EXPECT_EQ(sideForBend(BendDirection::UpLeft, Orientation::Vertical), Side::Left);
    EXPECT_EQ(sideForBend(BendDirection::DownLeft, Orientation::Vertical), Side::Left);

    EXPECT_EQ(sideForBend(BendDirection::UpRight, Orientation::Horizontal), Side::Top);
    EXPECT_EQ(sideForBend(BendDirection::UpLeft, Orientation::Horizontal), Side::Top);
    EXPECT_EQ(sideForBend(BendDirection::DownRight, Orientation::Horizontal), Side::Bottom);
    EXPECT_EQ(sideForBend(BendDirection::DownLeft, Orientation::Horizontal), Side::Bottom);
}

TEST(ChannelLegTest, ConnectorSideFacesTheBoxSide) {
    EXPECT_EQ(connectorSide(Side::Right), ConnectorSide::LeftOrTop);
    EXPECT_EQ(connectorSide(Side::Bottom), ConnectorSide::LeftOrTop);
    EXPECT_EQ(connectorSide(Side::Left), ConnectorSide::RightOrBottom);
    EXPECT_EQ(connectorSide(Side::Top), ConnectorSide::RightOrBottom);
}

TEST(LegOrderStateTest, LeftToRightStartsGlobal) {
    LegOrderState state({0.0f, 0.0f}, {20.0f, 0.0f});
    EXPECT_TRUE(state.currentIsGlobal());

    EXPECT_TRUE(state.isGlobalOrder(BendDirection::DownRight));
    EXPECT_TRUE(state.isGlobalOrder(BendDirection::DownLeft));
    EXPECT_FALSE(state.currentIsGlobal());
}

TEST(LegOrderStateTest, RightToLeftStartsReversed) {
    LegOrderState state({20.0f, 0.0f}, {0.0f, 0.0f});

    EXPECT_FALSE(state.isGlobalOrder(BendDirection::DownLeft));
    EXPECT_TRUE(state.isGlobalOrder(BendDirection::DownRight));
    EXPECT_TRUE(state.currentIsGlobal());
}

// ============== Assignment ==============

TEST(SlotAssignerTest, EmptyEdgesGiveZeroLanes) {
    const auto boxes = fiveBoxes();
    RoutingGraph graph = RoutingGraph::create(boxes);
    SlotAssignment slots = SlotAssigner::assign(graph, boxes, {}, {});

    EXPECT_TRUE(slots.edges.empty());
    EXPECT_EQ(slots.channelSlots.size(), graph.channels().size());
    for (uint32_t lanes : slots.channelSlots) {
        EXPECT_EQ(lanes, 0u);
    }
    EXPECT_EQ(slots.portSlotCounts.size(), boxes.size() * 4);
}

TEST(SlotAssignerTest, FiveBoxLanes) {
    const auto boxes = fiveBoxes();
    const auto edges = fiveEdges();
    RoutingGraph graph = RoutingGraph::create(boxes);
    auto routes = RouteFinder::routeEdges(graph, boxes, edges);
    SlotAssignment slots = SlotAssigner::assign(graph, boxes, edges, routes);

    EXPECT_EQ(slots.channelSlots, (std::vector<uint32_t>{1, 1, 1, 0, 1, 1, 0}));
    EXPECT_EQ(slots.detectedCycles, 0);
    ASSERT_EQ(slots.edges.size(), edges.size());
    for (size_t i = 0; i < edges.size(); ++i) {
        EXPECT_EQ(slots.edges[i].edgeIndex, i);
    }
}

TEST(SlotAssignerTest, FiveBoxPolylines) {
    const auto boxes = fiveBoxes();
    const auto edges = fiveEdges();
    RoutingGraph graph = RoutingGraph::create(boxes);
    auto routes = RouteFinder::routeEdges(graph, boxes, edges);
    SlotAssignment slots = SlotAssigner::assign(graph, boxes, edges, routes);

    auto polylines = OrthogonalRouter::buildPolylines(graph, boxes, routes, slots);
    ASSERT_EQ(polylines.size(), 7);

    expectPolyline(polylines[0], {{35.0f, 20.0f}, {43.75f, 20.0f}, {43.75f, 22.0f}, {55.0f, 22.0f}});
    expectPolyline(polylines[1], {{20.0f, 25.0f}, {20.0f, 30.0f}, {64.1667f, 30.0f}, {64.1667f, 35.0f}});
    expectPolyline(polylines[2], {{5.0f, 20.0f}, {-5.0f, 20.0f}, {-5.0f, 60.0f}, {12.5f, 60.0f}});
    expectPolyline(polylines[3], {{32.5f, 38.0f}, {43.75f, 38.0f}, {43.75f, 40.0f}, {52.5f, 40.0f}});
    expectPolyline(polylines[4], {{85.0f, 22.0f}, {97.5f, 22.0f}, {97.5f, 60.0f}, {67.5f, 60.0f}});
    expectPolyline(polylines[5], {{70.0f, 27.0f}, {70.0f, 30.0f}, {75.8333f, 30.0f}, {75.8333f, 35.0f}});
    expectPolyline(polylines[6], {{20.0f, 43.0f}, {20.0f, 50.0f}, {40.0f, 50.0f}, {40.0f, 55.0f}});
}

TEST(SlotAssignerTest, FanOutLanesAndSideSlots) {
    const std::vector<Rect> boxes{
        Rect(20.0f, 10.0f, 40.0f, 40.0f),   Rect(20.0f, 45.0f, 40.0f, 75.0f),
        Rect(20.0f, 80.0f, 40.0f, 110.0f),  Rect(60.0f, 30.0f, 100.0f, 90.0f),
        Rect(120.0f, 0.0f, 140.0f, 31.0f),  Rect(120.0f, 40.0f, 140.0f, 50.0f),
        Rect(120.0f, 100.0f, 140.0f, 120.0f), Rect(160.0f, 25.0f, 180.0f, 55.0f),
        Rect(120.0f, 60.0f, 140.0f, 75.0f), Rect(60.0f, 2.0f, 100.0f, 20.0f),
        Rect(60.0f, 100.0f, 100.0f, 140.0f)};
    const std::vector<OrthoEdge> edges{{1, 5}, {1, 5}, {1, 4}, {1, 4}, {1, 6}, {1, 6},
                                       {1, 8}, {1, 8}, {1, 9}, {1, 10}};
    RoutingGraph graph = RoutingGraph::create(boxes);
    auto routes = RouteFinder::routeEdges(graph, boxes, edges);
    SlotAssignment slots = SlotAssigner::assign(graph, boxes, edges, routes);

    EXPECT_EQ(slots.channelSlots,
              (std::vector<uint32_t>{0, 5, 2, 0, 0, 0, 0, 4, 0, 0, 0, 0, 4, 0}));
    EXPECT_EQ(slots.detectedCycles, 0);
    EXPECT_EQ(slots.portSlotCounts[1 * 4 + sideIndex(Side::Right)], 10u);

    // Parallel edges share a route but get their own slots.
    EXPECT_EQ(slots.edges[0].routeIndex, slots.edges[1].routeIndex);
    EXPECT_NE(slots.edges[0].portSlots.front(), slots.edges[1].portSlots.front());

    auto polylines = OrthogonalRouter::buildPolylines(graph, boxes, routes, slots);
    ASSERT_FALSE(polylines[0].empty());
    EXPECT_NEAR(polylines[0].front().x, 40.0f, 1e-3f);
    EXPECT_NEAR(polylines[0].front().y, 58.636f, 1e-3f);
}

TEST(SlotAssignerTest, EdgeWithoutRouteThrows) {
    const auto boxes = fiveBoxes();
    RoutingGraph graph = RoutingGraph::create(boxes);
    auto routes = RouteFinder::routeEdges(graph, boxes, {{0, 1}});
    EXPECT_THROW(SlotAssigner::assign(graph, boxes, {{0, 2}}, routes), std::logic_error);
}
