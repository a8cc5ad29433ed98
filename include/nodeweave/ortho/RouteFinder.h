#pragma once

#include "nodeweave/ortho/RoutingGraph.h"

#include <optional>
#include <vector>

namespace nodeweave {

/// Abstract route between two boxes: [port, bend..., port] routing vertices
/// with one bend direction per bend.
struct Route {
    NodeId from = 0;  ///< Always the smaller node id
    NodeId to = 0;
    std::vector<uint32_t> vertices;
    std::vector<BendDirection> bends;
};

/**
 * @brief Breadth-first route search over a RoutingGraph.
 *
 * One search runs per source node and serves all its targets. The search
 * keeps going straight along the current channel where it can and turns
 * into the crossing channel only when a neighbor leaves the channel, which
 * keeps the number of bends low.
 */
class RouteFinder {
public:
    /// Routes for the distinct undirected non-loop edges, sorted by (from, to).
    /// @throws std::invalid_argument for an endpoint outside boxes
    /// @throws std::logic_error if a target cannot be reached
    static std::vector<Route> routeEdges(const RoutingGraph& graph,
                                         const std::vector<Rect>& boxes,
                                         const std::vector<OrthoEdge>& edges);

    /// Index of the route joining a and b in either direction.
    static std::optional<size_t> findRoute(const std::vector<Route>& routes, NodeId a, NodeId b);

    /// Turn taken at a bend entered along o from `from`, heading to `to`.
    static BendDirection bendDirection(Point from, Point to, Orientation o);

    static std::vector<BendDirection> bendDirections(const RoutingGraph& graph,
                                                     const std::vector<Rect>& boxes,
                                                     const std::vector<uint32_t>& route);

    /// Drop intermediate ports and bends that do not change channel.
    static void removeStraightVertices(const RoutingGraph& graph, std::vector<uint32_t>& route);

private:
    static void routeFrom(const RoutingGraph& graph, NodeId from, const std::vector<NodeId>& targets,
                          std::vector<Route>& out);
};

}  // namespace nodeweave
