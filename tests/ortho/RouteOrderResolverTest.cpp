#include <gtest/gtest.h>
#include <nodeweave/ortho/RouteOrderResolver.h>

#include <stdexcept>
#include <vector>

using namespace nodeweave;

TEST(RouteOrderResolverTest, TopologicalSortPutsGreaterFirst) {
    RouteOrderResolver resolver(4);
    EXPECT_TRUE(resolver.addRouteOrder(0, 1));
    EXPECT_TRUE(resolver.addRouteOrder(0, 2));
    EXPECT_TRUE(resolver.addRouteOrder(1, 3));
    EXPECT_TRUE(resolver.addRouteOrder(2, 3));

    EXPECT_EQ(resolver.topologicalSort(), (std::vector<size_t>{0, 2, 1, 3}));
    EXPECT_EQ(resolver.detectedCycles(), 0);
}

TEST(RouteOrderResolverTest, UnorderedRoutesAreAllEmitted) {
    RouteOrderResolver resolver(3);
    auto order = resolver.topologicalSort();
    EXPECT_EQ(order.size(), 3);
}

TEST(RouteOrderResolverTest, CycleIsRejectedAndCounted) {
    RouteOrderResolver resolver(3);
    EXPECT_TRUE(resolver.addRouteOrder(0, 1));
    EXPECT_TRUE(resolver.addRouteOrder(1, 2));

    EXPECT_FALSE(resolver.addRouteOrder(2, 0));
    EXPECT_EQ(resolver.detectedCycles(), 1);

    EXPECT_EQ(resolver.topologicalSort(), (std::vector<size_t>{0, 1, 2}));
}

TEST(RouteOrderResolverTest, SelfOrderCountsAsCycle) {
    RouteOrderResolver resolver(2);
    EXPECT_FALSE(resolver.addRouteOrder(1, 1));
    EXPECT_EQ(resolver.detectedCycles(), 1);
}

TEST(RouteOrderResolverTest, HasPath) {
    RouteOrderResolver resolver(4);
    resolver.addRouteOrder(0, 1);
    resolver.addRouteOrder(1, 2);

    EXPECT_TRUE(resolver.hasPath(0, 2));
    EXPECT_FALSE(resolver.hasPath(2, 0));
    EXPECT_FALSE(resolver.hasPath(0, 3));
    EXPECT_TRUE(resolver.hasPath(3, 3));
}

TEST(RouteOrderResolverTest, UnknownRouteThrows) {
    RouteOrderResolver resolver(2);
    EXPECT_THROW(resolver.addRouteOrder(0, 2), std::out_of_range);
    EXPECT_THROW(resolver.addRouteOrder(5, 0), std::out_of_range);
    EXPECT_EQ(resolver.routeCount(), 2);
}
