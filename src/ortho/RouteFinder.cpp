#include "nodeweave/ortho/RouteFinder.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <cstddef>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace nodeweave {

namespace {

constexpr uint32_t NO_VERTEX = UINT32_MAX;

bool isChannelVertex(const RoutingVertex& v) {
    return v.kind != RoutingVertexKind::Box;
}

}  // namespace

std::vector<Route> RouteFinder::routeEdges(const RoutingGraph& graph,
                                           const std::vector<Rect>& boxes,
                                           const std::vector<OrthoEdge>& edges) {
    std::map<NodeId, std::vector<NodeId>> targetsBySource;
    for (const auto& edge : edges) {
        if (edge.from >= graph.boxCount() || edge.to >= graph.boxCount()) {
            throw std::invalid_argument("Edge endpoint out of range: " + std::to_string(edge.from) +
                                        " -> " + std::to_string(edge.to));
        }
        if (edge.from == edge.to) {
            continue;
        }
        auto& targets = targetsBySource[std::min(edge.from, edge.to)];
        const NodeId target = std::max(edge.from, edge.to);
        if (std::find(targets.begin(), targets.end(), target) == targets.end()) {
            targets.push_back(target);
        }
    }

    std::vector<Route> routes;
    for (auto& [source, targets] : targetsBySource) {
        std::sort(targets.begin(), targets.end());
        routeFrom(graph, source, targets, routes);
    }
    std::sort(routes.begin(), routes.end(), [](const Route& l, const Route& r) {
        return std::pair(l.from, l.to) < std::pair(r.from, r.to);
    });

    for (auto& route : routes) {
        route.bends = bendDirections(graph, boxes, route.vertices);
    }
    LOG_DEBUG("Routed {} of {} edges", routes.size(), edges.size());
    return routes;
}

void RouteFinder::routeFrom(const RoutingGraph& graph, NodeId from, const std::vector<NodeId>& targets,
                            std::vector<Route>& out) {
    const size_t n = graph.vertexCount();
    std::vector<bool> visited(n, false);
    std::vector<uint32_t> pred(n, NO_VERTEX);
    std::deque<std::pair<uint32_t, Orientation>> queue;

    visited[from] = true;
    for (uint32_t port : graph.neighbors(from)) {
        pred[port] = from;
        queue.emplace_back(port, orientationOf(graph.vertex(port).side));
    }

    size_t remaining = targets.size();
    while (!queue.empty() && remaining > 0) {
        const auto [current, orientation] = queue.front();
        queue.pop_front();
        visited[current] = true;
        const RoutingVertex& v = graph.vertex(current);

        if (v.kind == RoutingVertexKind::Box) {
            if (v.node == from || !std::binary_search(targets.begin(), targets.end(), v.node)) {
                continue;
            }
            Route route;
            route.from = from;
            route.to = v.node;
            for (uint32_t step = pred[current]; step != from; step = pred[step]) {
                route.vertices.push_back(step);
            }
            std::reverse(route.vertices.begin(), route.vertices.end());
            removeStraightVertices(graph, route.vertices);
            out.push_back(std::move(route));
            --remaining;
            continue;
        }

        // Stay in the current channel where possible; any neighbor that
        // would leave it is explored in the crossing orientation instead.
        const ChannelRef channel = graph.channelOf(current, orientation);
        bool leavesChannel = false;
        for (uint32_t next : graph.neighbors(current)) {
            if (visited[next]) {
                continue;
            }
            const RoutingVertex& nv = graph.vertex(next);
            if (isChannelVertex(nv) && graph.channelOf(next, orientation) != channel) {
                leavesChannel = true;
                continue;
            }
            visited[next] = true;
            pred[next] = current;
            queue.emplace_back(next, orientation);
        }
        if (leavesChannel) {
            const Orientation turned = other(orientation);
            for (uint32_t next : graph.neighbors(current)) {
                if (!visited[next]) {
                    visited[next] = true;
                    pred[next] = current;
                    queue.emplace_back(next, turned);
                }
            }
        }
    }

    if (remaining > 0) {
        LOG_ERROR("{} target(s) of node {} unreachable", remaining, from);
        throw std::logic_error("No orthogonal route from node " + std::to_string(from));
    }
}

void RouteFinder::removeStraightVertices(const RoutingGraph& graph, std::vector<uint32_t>& route) {
    if (route.size() < 2) {
        return;
    }
    const RoutingVertex& first = graph.vertex(route.front());
    ChannelRef current{first.channel, orientationOf(first.side)};
    size_t idx = 1;
    while (idx + 1 < route.size()) {
        const uint32_t id = route[idx];
        if (graph.vertex(id).kind == RoutingVertexKind::Port) {
            route.erase(route.begin() + static_cast<std::ptrdiff_t>(idx));
            continue;
        }
        if (graph.channelOf(id, current.orientation) ==
            graph.channelOf(route[idx + 1], current.orientation)) {
            route.erase(route.begin() + static_cast<std::ptrdiff_t>(idx));
            continue;
        }
        current = graph.channelOf(id, other(current.orientation));
        ++idx;
    }
}

BendDirection RouteFinder::bendDirection(Point from, Point to, Orientation o) {
    const float rx = to.x - from.x;
    const float ry = to.y - from.y;
    if (o == Orientation::Horizontal) {
        if (rx >= 0 && ry <= 0) return BendDirection::UpLeft;
        if (rx < 0 && ry <= 0) return BendDirection::UpRight;
        if (rx >= 0 && ry > 0) return BendDirection::DownLeft;
        return BendDirection::DownRight;
    }
    if (rx >= 0 && ry <= 0) return BendDirection::DownRight;
    if (rx < 0 && ry <= 0) return BendDirection::DownLeft;
    if (rx >= 0 && ry > 0) return BendDirection::UpRight;
    return BendDirection::UpLeft;
}

std::vector<BendDirection> RouteFinder::bendDirections(const RoutingGraph& graph,
                                                       const std::vector<Rect>& boxes,
                                                       const std::vector<uint32_t>& route) {
    std::vector<BendDirection> result;
    if (route.size() <= 2) {
        return result;
    }
    Orientation orientation = orientationOf(graph.vertex(route.front()).side);
    Point last = graph.vertexPoint(route.front(), boxes);
    for (size_t i = 1; i + 1 < route.size(); ++i) {
        const RoutingVertex& v = graph.vertex(route[i]);
        if (v.kind != RoutingVertexKind::Bend) {
            break;
        }
        const Point next = graph.vertexPoint(route[i + 1], boxes);
        result.push_back(bendDirection(last, next, orientation));
        orientation = other(orientation);
        last = graph.bendCenter(v.vChannel, v.hChannel);
    }
    return result;
}

std::optional<size_t> RouteFinder::findRoute(const std::vector<Route>& routes, NodeId a, NodeId b) {
    const auto key = std::pair(std::min(a, b), std::max(a, b));
    auto it = std::lower_bound(routes.begin(), routes.end(), key, [](const Route& r, const auto& k) {
        return std::pair(r.from, r.to) < k;
    });
    if (it == routes.end() || it->from != key.first || it->to != key.second) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - routes.begin());
}

}  // namespace nodeweave
