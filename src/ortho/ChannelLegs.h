#pragma once

#include "nodeweave/ortho/RoutingGraph.h"

#include <cstdint>
#include <vector>

namespace nodeweave {
namespace ortho_detail {

enum class ConnectorKind : uint8_t {
    Port,
    Bend
};

/// Which wall of the channel a connector attaches to.
enum class ConnectorSide : uint8_t {
    LeftOrTop,
    RightOrBottom
};

/// Where a route enters or leaves a channel. Every crossing contributes two
/// connectors, one per wall.
struct Connector {
    uint32_t slots = 0;              ///< Legs using this connector
    ConnectorKind kind = ConnectorKind::Port;
    uint32_t ref = 0;                ///< Node id or crossing channel index
    ConnectorSide side = ConnectorSide::LeftOrTop;
    size_t circularIndex = 0;
    float position = 0.0f;
};

using ChannelConnectors = std::vector<std::vector<Connector>>;

/// Node sides Right and Bottom face the channel's left or top wall.
ConnectorSide connectorSide(Side side);

/// Connectors per channel in global channel order (vertical first), sorted
/// by position and numbered clockwise: right/bottom wall forward, then the
/// left/top wall backward.
ChannelConnectors createConnectors(const RoutingGraph& graph, const std::vector<Rect>& boxes);

size_t circularDistance(size_t a, size_t b, const std::vector<Connector>& connectors);

size_t findPortConnector(const std::vector<Connector>& connectors, NodeId node);
size_t findBendConnector(const std::vector<Connector>& connectors, uint32_t crossChannel, Side side);

/// Relation of a leg's two attachment walls. The numeric order is the
/// outer-to-inner lane order inside a channel.
enum class PortSides : uint8_t {
    BothLeftOrTop = 0,
    CrossUp = 1,
    CrossDown = 2,
    BothRightOrBottom = 3
};

/// @throws std::logic_error if the sides open into different orientations
PortSides portSidesFrom(Side a, Side b, size_t connectorA, size_t connectorB);

/// Channel wall a route attaches to after taking bend inside an o channel.
Side sideForBend(BendDirection bend, Orientation o);

/// Part of a route running inside one channel.
struct ChannelLeg {
    size_t startConnector = 0;
    size_t endConnector = 0;
    size_t routeStart = 0;    ///< Route vertex index of the leg start
    size_t routeChannel = 0;  ///< Route index the channel slot is stored at
    size_t routeEnd = 0;
    size_t edge = 0;
    size_t circularDistance = 0;
    PortSides portSides = PortSides::BothLeftOrTop;
    int64_t routeOrder = 0;
    bool inGlobalOrder = true;
};

/// Three-way ordering of legs inside one channel (-1, 0, 1).
int compareLegs(const ChannelLeg& a, const ChannelLeg& b);

/// Route precedence implied by two legs of one channel (-1, 0, 1).
int relativeOrder(const ChannelLeg& a, const ChannelLeg& b);

/**
 * @brief Tracks whether the legs of one route follow the global route
 *        order or its reverse.
 *
 * Starts from the direction between the route end points; each bend flips
 * the sense for bends other than UpLeft and DownRight.
 */
class LegOrderState {
public:
    LegOrderState(Point from, Point to);

    /// Returns the state for the leg ending at this bend, then advances.
    bool isGlobalOrder(BendDirection bend);

    bool currentIsGlobal() const { return current_; }

private:
    bool current_;
};

}  // namespace ortho_detail
}  // namespace nodeweave
