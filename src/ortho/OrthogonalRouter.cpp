#include "nodeweave/ortho/OrthogonalRouter.h"
#include "nodeweave/ortho/ChannelResizer.h"
#include "nodeweave/ortho/RoutingGraph.h"
#include "nodeweave/common/Logger.h"

#include <stdexcept>
#include <string>

namespace nodeweave {

namespace {

/// Lane `slot` of `total` across a channel, level with p along it.
Point lanePoint(const Channel& channel, Point p, uint32_t slot, uint32_t total) {
    const Rect& r = channel.rect;
    if (channel.orientation == Orientation::Vertical) {
        const float spacing = r.width() / static_cast<float>(total + 1);
        return {r.left() + spacing * static_cast<float>(slot + 1), p.y};
    }
    const float spacing = r.height() / static_cast<float>(total + 1);
    return {p.x, r.top() + spacing * static_cast<float>(slot + 1)};
}

/// Attachment `slot` of `total` along a box side.
Point sidePoint(const Rect& box, Side side, uint32_t slot, uint32_t total) {
    if (side == Side::Right || side == Side::Left) {
        const float spacing = box.height() / static_cast<float>(total + 1);
        return {side == Side::Right ? box.right() : box.left(),
                box.top() + spacing * static_cast<float>(slot + 1)};
    }
    const float spacing = box.width() / static_cast<float>(total + 1);
    return {box.left() + spacing * static_cast<float>(slot + 1),
            side == Side::Top ? box.top() : box.bottom()};
}

void warnOnOverlap(const std::vector<Rect>& rects) {
    for (size_t i = 0; i < rects.size(); ++i) {
        for (size_t j = i + 1; j < rects.size(); ++j) {
            if (rects[i].overlaps(rects[j])) {
                LOG_WARN("Boxes {} and {} overlap, channels may be incomplete", i, j);
                return;
            }
        }
    }
}

}  // namespace

std::vector<std::vector<Point>> OrthogonalRouter::buildPolylines(const RoutingGraph& graph,
                                                                 const std::vector<Rect>& boxes,
                                                                 const std::vector<Route>& routes,
                                                                 const SlotAssignment& slots) {
    const ChannelSet& channels = graph.channels();
    std::vector<std::vector<Point>> result;
    result.reserve(slots.edges.size());

    for (const auto& edge : slots.edges) {
        const auto& path = routes.at(edge.routeIndex).vertices;
        std::vector<Point> points;
        bool started = false;
        ChannelRef last;

        for (size_t i = 0; i < path.size(); ++i) {
            const RoutingVertex& v = graph.vertex(path[i]);
            if (v.kind == RoutingVertexKind::Port) {
                const Orientation o = orientationOf(v.side);
                const Point port = sidePoint(boxes.at(v.node), v.side, edge.portSlots[i],
                                             slots.portSlotCounts[v.node * 4 + sideIndex(v.side)]);
                const uint32_t lane = started ? edge.channelSlots[i - 1] : edge.channelSlots[i];
                const Point inChannel = lanePoint(channels.get(v.channel, o), port, lane,
                                                  slots.channelSlots[channels.globalIndex(v.channel, o)]);
                if (started) {
                    points.push_back(inChannel);
                    points.push_back(port);
                } else {
                    points.push_back(port);
                    points.push_back(inChannel);
                    started = true;
                    last = {v.channel, o};
                }
            } else if (v.kind == RoutingVertexKind::Bend) {
                const uint32_t arriving = edge.channelSlots[i - 1];
                uint32_t vLane = arriving;
                uint32_t hLane = edge.channelSlots[i];
                uint32_t next = v.hChannel;
                if (last.orientation == Orientation::Horizontal) {
                    vLane = edge.channelSlots[i];
                    hLane = arriving;
                    next = v.vChannel;
                }
                const Point vp = lanePoint(channels.vertical.at(v.vChannel), Point{}, vLane,
                                           slots.channelSlots[v.vChannel]);
                const Point hp = lanePoint(channels.horizontal.at(v.hChannel), Point{}, hLane,
                                           slots.channelSlots[channels.globalIndex(v.hChannel, Orientation::Horizontal)]);
                points.emplace_back(vp.x, hp.y);
                last = {next, other(last.orientation)};
            }
        }
        result.push_back(std::move(points));
    }
    return result;
}

OrthoResult OrthogonalRouter::route(const std::vector<Rect>& rects,
                                    const std::vector<OrthoEdge>& edges,
                                    const OrthoOptions& options) {
    OrthoResult result;
    result.rects = rects;
    if (rects.empty()) {
        return result;
    }

    std::vector<OrthoEdge> routed;
    std::vector<size_t> inputIndex;
    for (size_t i = 0; i < edges.size(); ++i) {
        if (edges[i].from >= rects.size() || edges[i].to >= rects.size()) {
            throw std::invalid_argument("Edge " + std::to_string(i) + " endpoint out of range");
        }
        if (edges[i].from != edges[i].to) {
            routed.push_back(edges[i]);
            inputIndex.push_back(i);
        }
    }
    warnOnOverlap(rects);

    RoutingGraph graph = RoutingGraph::create(rects, ChannelBuilder::buildChannels(rects, options.frameMargin));
    const std::vector<Route> routes = RouteFinder::routeEdges(graph, rects, routed);
    const SlotAssignment slots = SlotAssigner::assign(graph, rects, routed, routes);

    ChannelSet& channels = graph.channels();
    auto minWidths = [&](size_t offset, size_t count) {
        std::vector<float> widths;
        widths.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            widths.push_back(options.laneMargin +
                             static_cast<float>(slots.channelSlots[offset + i]) * options.laneSpacing);
        }
        return widths;
    };
    ChannelResizer::resize(result.rects, channels,
                           minWidths(0, channels.vertical.size()),
                           minWidths(channels.vertical.size(), channels.horizontal.size()));

    std::vector<std::vector<Point>> polylines = buildPolylines(graph, result.rects, routes, slots);
    result.edgeRoutes.reserve(polylines.size());
    for (size_t i = 0; i < polylines.size(); ++i) {
        EdgeRoute route;
        route.edgeIndex = inputIndex[i];
        route.from = routed[i].from;
        route.to = routed[i].to;
        route.points = std::move(polylines[i]);
        route.channelSlots = slots.edges[i].channelSlots;
        result.edgeRoutes.push_back(std::move(route));
    }
    result.channelSlots = slots.channelSlots;
    result.detectedCycles = slots.detectedCycles;

    LOG_INFO("Routed {} edges through {} channels", result.edgeRoutes.size(), channels.size());
    return result;
}

OrthoResult OrthogonalRouter::route(const LayoutGraph& graph,
                                    const std::vector<NodePosition>& positions,
                                    const OrthoOptions& options) {
    if (positions.size() != graph.nodeCount()) {
        throw std::invalid_argument("OrthogonalRouter: positions.size() " +
                                    std::to_string(positions.size()) + " != node count " +
                                    std::to_string(graph.nodeCount()));
    }

    std::vector<Rect> rects;
    rects.reserve(graph.nodeCount());
    for (NodeId i = 0; i < graph.nodeCount(); ++i) {
        rects.push_back(Rect::fromCenterSize(positions[i].pos, graph.nodeSize(i)));
    }

    std::vector<OrthoEdge> edges;
    std::vector<EdgeId> ids;
    for (const auto& edge : graph.edges()) {
        if (graph.isEdgeVisible(edge) && !edge.isSelfLoop()) {
            edges.push_back({edge.from, edge.to});
            ids.push_back(edge.id);
        }
    }

    OrthoResult result = route(rects, edges, options);
    for (auto& edgeRoute : result.edgeRoutes) {
        edgeRoute.edgeIndex = ids[edgeRoute.edgeIndex];
    }
    return result;
}

void OrthogonalRouter::applyPositions(const OrthoResult& result, std::vector<NodePosition>& positions) {
    if (positions.size() != result.rects.size()) {
        throw std::invalid_argument("applyPositions: " + std::to_string(positions.size()) +
                                    " positions for " + std::to_string(result.rects.size()) + " boxes");
    }
    for (size_t i = 0; i < positions.size(); ++i) {
        positions[i].pos = result.rects[i].center();
        positions[i].vel = Point{};
    }
}

}  // namespace nodeweave
