#include "nodeweave/ortho/SlotAssigner.h"
#include "nodeweave/ortho/RouteOrderResolver.h"
#include "nodeweave/common/Logger.h"
#include "ChannelLegs.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace nodeweave {

using namespace ortho_detail;

namespace {

/// Free slot range on one connector or channel section, consumed from
/// either end.
struct SlotRange {
    uint32_t low = 0;
    uint32_t high = 0;

    uint32_t consume(bool fromHigh) {
        if (fromHigh) {
            const uint32_t slot = high;
            if (high > 0) {
                --high;
            }
            return slot;
        }
        return low++;
    }
};

bool legLess(const ChannelLeg& a, const ChannelLeg& b) {
    return compareLegs(a, b) < 0;
}

size_t portSlotIndex(const RoutingVertex& port) {
    return static_cast<size_t>(port.node) * 4 + sideIndex(port.side);
}

void assignChannelSlots(const std::vector<ChannelLeg>& legs,
                        const std::vector<Connector>& connectors,
                        uint32_t channelSlots,
                        std::vector<EdgeSlots>& edgeSlots) {
    std::vector<SlotRange> between(connectors.size(), SlotRange{0, channelSlots > 0 ? channelSlots - 1 : 0});
    std::vector<SlotRange> free;
    free.reserve(connectors.size());
    for (const auto& c : connectors) {
        free.push_back({0, c.slots > 0 ? c.slots - 1 : 0});
    }

    for (const auto& leg : legs) {
        const size_t s = leg.startConnector;
        const size_t e = leg.endConnector;
        const auto [a, b] = std::minmax(s, e);
        EdgeSlots& slots = edgeSlots[leg.edge];

        uint32_t lane = 0;
        if (leg.portSides == PortSides::BothRightOrBottom) {
            // Lanes fill from the right or bottom wall inward.
            lane = UINT32_MAX;
            for (size_t i = a; i < b; ++i) {
                lane = std::min(lane, between[i].high);
            }
            if (a == b) {
                lane = 0;
            }
            for (size_t i = a; i < b; ++i) {
                between[i].high = lane > 0 ? lane - 1 : 0;
            }
        } else {
            for (size_t i = a; i < b; ++i) {
                lane = std::max(lane, between[i].low);
            }
            for (size_t i = a; i < b; ++i) {
                between[i].low = lane + 1;
            }
        }
        slots.channelSlots[leg.routeChannel] = lane;

        auto takeStart = [&] { slots.portSlots[leg.routeStart] = free[s].consume(e > s); };
        auto takeEnd = [&] { slots.portSlots[leg.routeEnd] = free[e].consume(e < s); };
        switch (leg.portSides) {
            case PortSides::BothLeftOrTop:
            case PortSides::BothRightOrBottom:
                takeStart();
                takeEnd();
                break;
            case PortSides::CrossDown:
                if (s > e) takeEnd(); else takeStart();
                break;
            case PortSides::CrossUp:
                if (s < e) takeEnd(); else takeStart();
                break;
        }
    }

    // Crossing legs take their other end in reverse order.
    for (auto it = legs.rbegin(); it != legs.rend(); ++it) {
        const ChannelLeg& leg = *it;
        const size_t s = leg.startConnector;
        const size_t e = leg.endConnector;
        EdgeSlots& slots = edgeSlots[leg.edge];
        auto takeStart = [&] { slots.portSlots[leg.routeStart] = free[s].consume(e > s); };
        auto takeEnd = [&] { slots.portSlots[leg.routeEnd] = free[e].consume(e < s); };
        if (leg.portSides == PortSides::CrossDown) {
            if (s < e) takeEnd(); else takeStart();
        } else if (leg.portSides == PortSides::CrossUp) {
            if (s > e) takeEnd(); else takeStart();
        }
    }
}

}  // namespace

SlotAssignment SlotAssigner::assign(const RoutingGraph& graph,
                                    const std::vector<Rect>& boxes,
                                    const std::vector<OrthoEdge>& edges,
                                    const std::vector<Route>& routes) {
    const ChannelSet& channels = graph.channels();
    ChannelConnectors connectors = createConnectors(graph, boxes);
    std::vector<std::vector<ChannelLeg>> legs(channels.size());

    SlotAssignment result;
    result.portSlotCounts.assign(graph.boxCount() * 4, 0);
    result.edges.reserve(edges.size());

    for (size_t edgeIndex = 0; edgeIndex < edges.size(); ++edgeIndex) {
        const OrthoEdge& edge = edges[edgeIndex];
        const auto routeIndex = RouteFinder::findRoute(routes, edge.from, edge.to);
        if (!routeIndex) {
            LOG_ERROR("Edge {} ({} -> {}) has no route", edgeIndex, edge.from, edge.to);
            throw std::logic_error("Edge " + std::to_string(edgeIndex) + " has no route");
        }
        const Route& route = routes[*routeIndex];
        const auto& path = route.vertices;
        if (path.size() < 2 || route.bends.size() + 2 != path.size()) {
            throw std::logic_error("Malformed route for edge " + std::to_string(edgeIndex));
        }

        EdgeSlots slots;
        slots.routeIndex = *routeIndex;
        slots.edgeIndex = edgeIndex;
        slots.portSlots.assign(path.size(), 0);
        slots.channelSlots.assign(path.size(), 0);
        result.edges.push_back(std::move(slots));

        auto addLeg = [&](size_t channel, size_t sc, size_t ec, size_t routeStart, PortSides sides,
                          bool global) {
            auto& cc = connectors[channel];
            ++cc[sc].slots;
            ++cc[ec].slots;
            ChannelLeg leg;
            leg.startConnector = sc;
            leg.endConnector = ec;
            leg.routeStart = routeStart;
            leg.routeChannel = routeStart;
            leg.routeEnd = routeStart + 1;
            leg.edge = edgeIndex;
            leg.circularDistance = circularDistance(sc, ec, cc);
            leg.portSides = sides;
            leg.inGlobalOrder = global;
            legs[channel].push_back(leg);
        };

        LegOrderState order(boxes.at(route.from).center(), boxes.at(route.to).center());
        const RoutingVertex& start = graph.vertex(path[0]);
        ++result.portSlotCounts[portSlotIndex(start)];
        Orientation orientation = orientationOf(start.side);

        const RoutingVertex& second = graph.vertex(path[1]);
        if (second.kind == RoutingVertexKind::Port) {
            ++result.portSlotCounts[portSlotIndex(second)];
            const size_t channel = channels.globalIndex(second.channel, orientationOf(second.side));
            const size_t sc = findPortConnector(connectors[channel], start.node);
            const size_t ec = findPortConnector(connectors[channel], second.node);
            addLeg(channel, sc, ec, 0, portSidesFrom(opposite(start.side), opposite(second.side), sc, ec),
                   true);
            continue;
        }

        size_t channel = channels.globalIndex(start.channel, orientation);
        uint32_t cross = orientation == Orientation::Vertical ? second.hChannel : second.vChannel;
        Side endSide = sideForBend(route.bends[0], orientation);
        size_t sc = findPortConnector(connectors[channel], start.node);
        size_t ec = findBendConnector(connectors[channel], cross, endSide);
        const PortSides firstSides = portSidesFrom(opposite(start.side), endSide, sc, ec);
        addLeg(channel, sc, ec, 0, firstSides, order.isGlobalOrder(route.bends[0]));

        uint32_t current = cross;
        BendDirection lastBend = route.bends[0];
        orientation = other(orientation);
        size_t bendIndex = 1;

        for (size_t pos = 2; pos < path.size(); ++pos) {
            const RoutingVertex& v = graph.vertex(path[pos]);
            const RoutingVertex& prev = graph.vertex(path[pos - 1]);
            const uint32_t prevCross = orientation == Orientation::Vertical ? prev.hChannel : prev.vChannel;
            const Side startSide = sideForBend(lastBend, orientation);

            if (v.kind == RoutingVertexKind::Port) {
                ++result.portSlotCounts[portSlotIndex(v)];
                channel = channels.globalIndex(v.channel, orientationOf(v.side));
                sc = findBendConnector(connectors[channel], prevCross, startSide);
                ec = findPortConnector(connectors[channel], v.node);
                addLeg(channel, sc, ec, pos - 1, portSidesFrom(startSide, opposite(v.side), sc, ec),
                       order.currentIsGlobal());
                break;
            }

            cross = orientation == Orientation::Vertical ? v.hChannel : v.vChannel;
            channel = channels.globalIndex(current, orientation);
            endSide = sideForBend(route.bends[bendIndex], orientation);
            sc = findBendConnector(connectors[channel], prevCross, startSide);
            ec = findBendConnector(connectors[channel], cross, endSide);
            const PortSides sides = portSidesFrom(startSide, endSide, sc, ec);
            addLeg(channel, sc, ec, pos - 1, sides, order.isGlobalOrder(route.bends[bendIndex]));

            lastBend = route.bends[bendIndex];
            orientation = other(orientation);
            current = cross;
            ++bendIndex;
        }
    }

    // Lanes needed: the deepest overlap of legs between consecutive connectors.
    result.channelSlots.assign(channels.size(), 0);
    for (size_t channel = 0; channel < channels.size(); ++channel) {
        std::vector<uint32_t> overlap(connectors[channel].size(), 0);
        for (const auto& leg : legs[channel]) {
            const auto [a, b] = std::minmax(leg.startConnector, leg.endConnector);
            for (size_t i = a; i < b; ++i) {
                ++overlap[i];
            }
        }
        if (!overlap.empty()) {
            result.channelSlots[channel] = *std::max_element(overlap.begin(), overlap.end());
        }
    }

    RouteOrderResolver resolver(edges.size());
    for (auto& channelLegs : legs) {
        std::stable_sort(channelLegs.begin(), channelLegs.end(), legLess);
        for (size_t i = 0; i + 1 < channelLegs.size(); ++i) {
            for (size_t j = i + 1; j < channelLegs.size(); ++j) {
                const ChannelLeg& li = channelLegs[i];
                const ChannelLeg& lj = channelLegs[j];
                const int rel = relativeOrder(li, lj);
                if (rel == 0) {
                    continue;
                }
                bool iFirst = rel < 0;
                if (!li.inGlobalOrder && !lj.inGlobalOrder) {
                    iFirst = !iFirst;
                }
                if (iFirst) {
                    resolver.addRouteOrder(li.edge, lj.edge);
                } else {
                    resolver.addRouteOrder(lj.edge, li.edge);
                }
            }
        }
    }
    result.detectedCycles = resolver.detectedCycles();
    if (result.detectedCycles > 0) {
        LOG_DEBUG("Dropped {} conflicting route orders", result.detectedCycles);
    }

    std::vector<int64_t> rank(edges.size(), 0);
    const std::vector<size_t> sorted = resolver.topologicalSort();
    for (size_t k = 0; k < sorted.size(); ++k) {
        rank[sorted[k]] = static_cast<int64_t>(k);
    }

    for (size_t channel = 0; channel < legs.size(); ++channel) {
        auto& channelLegs = legs[channel];
        if (channelLegs.empty()) {
            continue;
        }
        for (auto& leg : channelLegs) {
            leg.routeOrder = leg.inGlobalOrder ? rank[leg.edge] : -rank[leg.edge];
        }
        std::stable_sort(channelLegs.begin(), channelLegs.end(), legLess);
        assignChannelSlots(channelLegs, connectors[channel], result.channelSlots[channel], result.edges);
    }

    return result;
}

}  // namespace nodeweave
