#pragma once

#include "nodeweave/core/Types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace nodeweave {

/// Side of a node box. The numeric value indexes per-side port slots
/// (node * 4 + side).
enum class Side : uint8_t {
    Right = 0,
    Left = 1,
    Top = 2,
    Bottom = 3
};

enum class Orientation : uint8_t {
    Vertical,
    Horizontal
};

/// Turn taken at a channel crossing, named by the quadrant the route
/// continues into relative to the crossing.
enum class BendDirection : uint8_t {
    UpLeft,
    UpRight,
    DownLeft,
    DownRight
};

inline Side opposite(Side side) {
    switch (side) {
        case Side::Right: return Side::Left;
        case Side::Left: return Side::Right;
        case Side::Top: return Side::Bottom;
        case Side::Bottom: return Side::Top;
    }
    return side;
}

/// Left and right sides open into vertical channels.
inline Orientation orientationOf(Side side) {
    return (side == Side::Left || side == Side::Right) ? Orientation::Vertical
                                                       : Orientation::Horizontal;
}

inline Orientation other(Orientation o) {
    return o == Orientation::Vertical ? Orientation::Horizontal : Orientation::Vertical;
}

inline size_t sideIndex(Side side) { return static_cast<size_t>(side); }

/// Midpoint of a box side.
inline Point portPoint(const Rect& box, Side side) {
    const Point c = box.center();
    switch (side) {
        case Side::Right: return {box.right(), c.y};
        case Side::Left: return {box.left(), c.y};
        case Side::Top: return {c.x, box.top()};
        case Side::Bottom: return {c.x, box.bottom()};
    }
    return c;
}

/// Coordinate of a side midpoint along the channel it opens into.
inline float portCoordinate(const Rect& box, Side side) {
    return orientationOf(side) == Orientation::Vertical ? box.center().y : box.center().x;
}

std::string toString(Side side);
std::string toString(BendDirection bend);

enum class ChannelPortKind : uint8_t {
    NodeSide,
    Bend
};

/**
 * @brief Attachment point along a channel.
 *
 * NodeSide ports record which box side opens into the channel. Bend ports
 * mark the crossing with crossChannel, an index into the channels of the
 * other orientation.
 */
struct ChannelPort {
    ChannelPortKind kind = ChannelPortKind::NodeSide;
    NodeId node = INVALID_NODE;
    Side side = Side::Right;
    uint32_t crossChannel = 0;
    float position = 0.0f;          ///< Coordinate along the channel
    uint32_t vertex = UINT32_MAX;   ///< Routing graph vertex, once assigned
};

/// Free rectangle between node boxes that routes may run through.
struct Channel {
    Rect rect;
    Orientation orientation = Orientation::Vertical;
    std::vector<ChannelPort> ports;

    /// Extent across the channel: x for vertical, y for horizontal.
    float width() const {
        return orientation == Orientation::Vertical ? rect.width() : rect.height();
    }

    /// Point on the channel center line level with p.
    Point centerLine(Point p) const {
        const Point c = rect.center();
        return orientation == Orientation::Vertical ? Point{c.x, p.y} : Point{p.x, c.y};
    }
};

struct ChannelSet {
    std::vector<Channel> vertical;
    std::vector<Channel> horizontal;

    size_t size() const { return vertical.size() + horizontal.size(); }

    /// Vertical channels come first in the global numbering.
    size_t globalIndex(uint32_t index, Orientation o) const {
        return o == Orientation::Vertical ? index : vertical.size() + index;
    }

    Channel& get(uint32_t index, Orientation o) {
        return o == Orientation::Vertical ? vertical.at(index) : horizontal.at(index);
    }
    const Channel& get(uint32_t index, Orientation o) const {
        return o == Orientation::Vertical ? vertical.at(index) : horizontal.at(index);
    }
};

/// Edge to route between two node boxes.
struct OrthoEdge {
    NodeId from = 0;
    NodeId to = 0;
};

}  // namespace nodeweave
