#pragma once

#include "nodeweave/ortho/OrthoTypes.h"

#include <cstdint>
#include <vector>

namespace nodeweave {

enum class RoutingVertexKind : uint8_t {
    Box,
    Port,
    Bend
};

/// Vertex of the routing graph. Which fields are meaningful depends on kind:
/// Box uses node; Port uses node, side and channel; Bend uses vChannel and
/// hChannel.
struct RoutingVertex {
    RoutingVertexKind kind = RoutingVertexKind::Box;
    NodeId node = INVALID_NODE;
    Side side = Side::Right;
    uint32_t channel = 0;
    uint32_t vChannel = 0;
    uint32_t hChannel = 0;
};

struct ChannelRef {
    uint32_t index = 0;
    Orientation orientation = Orientation::Vertical;

    bool operator==(const ChannelRef& o) const {
        return index == o.index && orientation == o.orientation;
    }
    bool operator!=(const ChannelRef& o) const { return !(*this == o); }
};

/**
 * @brief Undirected graph over boxes, box-side ports and channel crossings.
 *
 * Vertex layout: boxes [0, boxCount), then one port per node-side channel
 * port (vertical channels first), then one bend per crossing of a vertical
 * and a horizontal channel from bendStart(). Each port links to its box and
 * ports along a channel link to their neighbors in position order.
 */
class RoutingGraph {
public:
    /// Channels must carry node-side ports only, as built by ChannelBuilder.
    static RoutingGraph create(const std::vector<Rect>& boxes, ChannelSet channels);
    static RoutingGraph create(const std::vector<Rect>& boxes);

    size_t boxCount() const { return boxCount_; }
    size_t vertexCount() const { return vertices_.size(); }
    uint32_t bendStart() const { return bendStart_; }

    const RoutingVertex& vertex(uint32_t id) const { return vertices_.at(id); }
    const std::vector<uint32_t>& neighbors(uint32_t id) const { return adjacency_.at(id); }

    const ChannelSet& channels() const { return channels_; }
    ChannelSet& channels() { return channels_; }

    /// Channel a port or bend travels in when moving along orientation o.
    /// Ports always report their own channel.
    /// @throws std::logic_error for box vertices
    ChannelRef channelOf(uint32_t vertexId, Orientation o) const;

    /// Center of the crossing of two channels.
    Point bendCenter(uint32_t vChannel, uint32_t hChannel) const;

    /// Point a port or bend vertex maps to on the channel center lines.
    Point vertexPoint(uint32_t vertexId, const std::vector<Rect>& boxes) const;

private:
    uint32_t addVertex(const RoutingVertex& v);
    void link(uint32_t a, uint32_t b);

    std::vector<RoutingVertex> vertices_;
    std::vector<std::vector<uint32_t>> adjacency_;
    ChannelSet channels_;
    size_t boxCount_ = 0;
    uint32_t bendStart_ = 0;
};

}  // namespace nodeweave
