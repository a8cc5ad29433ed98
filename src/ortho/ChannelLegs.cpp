#include "ChannelLegs.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace nodeweave {
namespace ortho_detail {

namespace {

int compareValues(auto a, auto b) {
    return (a > b) - (a < b);
}

void numberCircular(std::vector<Connector>& connectors) {
    size_t k = 0;
    for (auto& c : connectors) {
        if (c.side == ConnectorSide::RightOrBottom) {
            c.circularIndex = k++;
        }
    }
    for (auto it = connectors.rbegin(); it != connectors.rend(); ++it) {
        if (it->side == ConnectorSide::LeftOrTop) {
            it->circularIndex = k++;
        }
    }
}

}  // namespace

ConnectorSide connectorSide(Side side) {
    return (side == Side::Right || side == Side::Bottom) ? ConnectorSide::LeftOrTop
                                                         : ConnectorSide::RightOrBottom;
}

ChannelConnectors createConnectors(const RoutingGraph& graph, const std::vector<Rect>& boxes) {
    const ChannelSet& channels = graph.channels();
    ChannelConnectors result;
    result.reserve(channels.size());

    auto build = [&](const Channel& channel) {
        std::vector<Connector> connectors;
        for (const auto& port : channel.ports) {
            if (port.kind != ChannelPortKind::NodeSide) {
                continue;
            }
            Connector c;
            c.kind = ConnectorKind::Port;
            c.ref = port.node;
            c.side = connectorSide(port.side);
            c.position = portCoordinate(boxes.at(port.node), port.side);
            connectors.push_back(c);
        }
        for (const auto& port : channel.ports) {
            if (port.kind != ChannelPortKind::Bend) {
                continue;
            }
            Connector c;
            c.kind = ConnectorKind::Bend;
            c.ref = port.crossChannel;
            c.position = port.position;
            c.side = ConnectorSide::RightOrBottom;
            connectors.push_back(c);
            c.side = ConnectorSide::LeftOrTop;
            connectors.push_back(c);
        }
        std::stable_sort(connectors.begin(), connectors.end(),
                         [](const Connector& l, const Connector& r) { return l.position < r.position; });
        numberCircular(connectors);
        result.push_back(std::move(connectors));
    };

    for (const auto& channel : channels.vertical) {
        build(channel);
    }
    for (const auto& channel : channels.horizontal) {
        build(channel);
    }
    return result;
}

size_t circularDistance(size_t a, size_t b, const std::vector<Connector>& connectors) {
    const size_t ia = connectors.at(a).circularIndex;
    const size_t ib = connectors.at(b).circularIndex;
    const size_t d = ia > ib ? ia - ib : ib - ia;
    return d > connectors.size() / 2 ? connectors.size() - d : d;
}

size_t findPortConnector(const std::vector<Connector>& connectors, NodeId node) {
    for (size_t i = 0; i < connectors.size(); ++i) {
        if (connectors[i].kind == ConnectorKind::Port && connectors[i].ref == node) {
            return i;
        }
    }
    throw std::logic_error("No port connector for node " + std::to_string(node));
}

size_t findBendConnector(const std::vector<Connector>& connectors, uint32_t crossChannel, Side side) {
    const ConnectorSide wanted = connectorSide(side);
    for (size_t i = 0; i < connectors.size(); ++i) {
        if (connectors[i].kind == ConnectorKind::Bend && connectors[i].side == wanted &&
            connectors[i].ref == crossChannel) {
            return i;
        }
    }
    throw std::logic_error("No bend connector for crossing channel " + std::to_string(crossChannel));
}

PortSides portSidesFrom(Side a, Side b, size_t connectorA, size_t connectorB) {
    if (orientationOf(a) != orientationOf(b)) {
        throw std::logic_error("Leg sides " + toString(a) + " and " + toString(b) +
                               " open into different channel orientations");
    }
    if (a == b) {
        return (a == Side::Right || a == Side::Bottom) ? PortSides::BothRightOrBottom
                                                       : PortSides::BothLeftOrTop;
    }
    if ((a == Side::Left && b == Side::Right) || (a == Side::Top && b == Side::Bottom)) {
        return connectorA < connectorB ? PortSides::CrossDown : PortSides::CrossUp;
    }
    return connectorA > connectorB ? PortSides::CrossDown : PortSides::CrossUp;
}

Side sideForBend(BendDirection bend, Orientation o) {
    if (o == Orientation::Vertical) {
        return (bend == BendDirection::UpRight || bend == BendDirection::DownRight) ? Side::Right
                                                                                    : Side::Left;
    }
    return (bend == BendDirection::UpRight || bend == BendDirection::UpLeft) ? Side::Top
                                                                             : Side::Bottom;
}

int compareLegs(const ChannelLeg& a, const ChannelLeg& b) {
    int r = compareValues(static_cast<int>(a.portSides), static_cast<int>(b.portSides));
    if (r != 0) {
        return r;
    }
    switch (a.portSides) {
        case PortSides::BothLeftOrTop:
        case PortSides::BothRightOrBottom:
            r = compareValues(a.circularDistance, b.circularDistance);
            break;
        case PortSides::CrossUp:
        case PortSides::CrossDown: {
            const auto [aMin, aMax] = std::minmax(a.startConnector, a.endConnector);
            const auto [bMin, bMax] = std::minmax(b.startConnector, b.endConnector);
            if (a.portSides == PortSides::CrossUp) {
                r = compareValues(aMin, bMin);
                if (r == 0) r = compareValues(aMax, bMax);
            } else {
                r = compareValues(bMax, aMax);
                if (r == 0) r = compareValues(bMin, aMin);
            }
            break;
        }
    }
    if (r != 0) {
        return r;
    }
    if (a.portSides == PortSides::BothRightOrBottom) {
        return compareValues(b.routeOrder, a.routeOrder);
    }
    return compareValues(a.routeOrder, b.routeOrder);
}

int relativeOrder(const ChannelLeg& a, const ChannelLeg& b) {
    if (a.portSides == b.portSides) {
        return a.portSides == PortSides::BothRightOrBottom ? -compareLegs(a, b) : compareLegs(a, b);
    }
    return compareValues(static_cast<int>(a.portSides), static_cast<int>(b.portSides));
}

LegOrderState::LegOrderState(Point from, Point to)
    : current_(from.x < to.x || (from.x == to.x && from.y < to.y)) {}

bool LegOrderState::isGlobalOrder(BendDirection bend) {
    bool global = bend == BendDirection::UpLeft || bend == BendDirection::DownRight;
    const bool last = current_;
    if (!current_) {
        global = !global;
    }
    current_ = global;
    return last;
}

}  // namespace ortho_detail
}  // namespace nodeweave
