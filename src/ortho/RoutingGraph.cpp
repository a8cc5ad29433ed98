#include "nodeweave/ortho/RoutingGraph.h"
#include "nodeweave/ortho/ChannelBuilder.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace nodeweave {

RoutingGraph RoutingGraph::create(const std::vector<Rect>& boxes) {
    return create(boxes, ChannelBuilder::buildChannels(boxes));
}

RoutingGraph RoutingGraph::create(const std::vector<Rect>& boxes, ChannelSet channels) {
    RoutingGraph graph;
    graph.channels_ = std::move(channels);
    graph.boxCount_ = boxes.size();

    for (NodeId i = 0; i < boxes.size(); ++i) {
        RoutingVertex v;
        v.kind = RoutingVertexKind::Box;
        v.node = i;
        graph.addVertex(v);
    }

    auto addPorts = [&graph](std::vector<Channel>& list) {
        for (uint32_t ci = 0; ci < list.size(); ++ci) {
            auto& ports = list[ci].ports;
            std::erase_if(ports, [](const ChannelPort& p) { return p.kind == ChannelPortKind::Bend; });
            for (auto& port : ports) {
                RoutingVertex v;
                v.kind = RoutingVertexKind::Port;
                v.node = port.node;
                v.side = port.side;
                v.channel = ci;
                port.vertex = graph.addVertex(v);
                graph.link(port.node, port.vertex);
            }
        }
    };
    addPorts(graph.channels_.vertical);
    addPorts(graph.channels_.horizontal);

    graph.bendStart_ = static_cast<uint32_t>(graph.vertices_.size());
    auto& vertical = graph.channels_.vertical;
    auto& horizontal = graph.channels_.horizontal;
    for (uint32_t vi = 0; vi < vertical.size(); ++vi) {
        for (uint32_t hi = 0; hi < horizontal.size(); ++hi) {
            if (!vertical[vi].rect.intersects(horizontal[hi].rect)) {
                continue;
            }
            const Point c = vertical[vi].rect.intersection(horizontal[hi].rect).center();
            RoutingVertex v;
            v.kind = RoutingVertexKind::Bend;
            v.vChannel = vi;
            v.hChannel = hi;
            const uint32_t id = graph.addVertex(v);

            ChannelPort onVertical;
            onVertical.kind = ChannelPortKind::Bend;
            onVertical.crossChannel = hi;
            onVertical.position = c.y;
            onVertical.vertex = id;
            vertical[vi].ports.push_back(onVertical);

            ChannelPort onHorizontal = onVertical;
            onHorizontal.crossChannel = vi;
            onHorizontal.position = c.x;
            horizontal[hi].ports.push_back(onHorizontal);
        }
    }

    auto chain = [&graph](std::vector<Channel>& list) {
        for (auto& channel : list) {
            std::stable_sort(channel.ports.begin(), channel.ports.end(),
                             [](const ChannelPort& l, const ChannelPort& r) { return l.position < r.position; });
            for (size_t i = 1; i < channel.ports.size(); ++i) {
                graph.link(channel.ports[i - 1].vertex, channel.ports[i].vertex);
            }
        }
    };
    chain(vertical);
    chain(horizontal);

    LOG_DEBUG("{} vertices, {} bends", graph.vertices_.size(),
              graph.vertices_.size() - graph.bendStart_);
    return graph;
}

uint32_t RoutingGraph::addVertex(const RoutingVertex& v) {
    vertices_.push_back(v);
    adjacency_.emplace_back();
    return static_cast<uint32_t>(vertices_.size() - 1);
}

void RoutingGraph::link(uint32_t a, uint32_t b) {
    adjacency_[a].push_back(b);
    adjacency_[b].push_back(a);
}

ChannelRef RoutingGraph::channelOf(uint32_t vertexId, Orientation o) const {
    const RoutingVertex& v = vertex(vertexId);
    switch (v.kind) {
        case RoutingVertexKind::Port:
            return {v.channel, orientationOf(v.side)};
        case RoutingVertexKind::Bend:
            return o == Orientation::Vertical ? ChannelRef{v.vChannel, Orientation::Vertical}
                                              : ChannelRef{v.hChannel, Orientation::Horizontal};
        case RoutingVertexKind::Box:
            break;
    }
    throw std::logic_error("Box vertex " + std::to_string(vertexId) + " has no channel");
}

Point RoutingGraph::bendCenter(uint32_t vChannel, uint32_t hChannel) const {
    return channels_.vertical.at(vChannel).rect.intersection(channels_.horizontal.at(hChannel).rect).center();
}

Point RoutingGraph::vertexPoint(uint32_t vertexId, const std::vector<Rect>& boxes) const {
    const RoutingVertex& v = vertex(vertexId);
    switch (v.kind) {
        case RoutingVertexKind::Port: {
            const Channel& channel = channels_.get(v.channel, orientationOf(v.side));
            return channel.centerLine(portPoint(boxes.at(v.node), v.side));
        }
        case RoutingVertexKind::Bend:
            return bendCenter(v.vChannel, v.hChannel);
        case RoutingVertexKind::Box:
            return boxes.at(v.node).center();
    }
    return {};
}

}  // namespace nodeweave
