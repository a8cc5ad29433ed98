#include "nodeweave/ortho/ChannelBuilder.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <cstddef>
#include <optional>

namespace nodeweave {

namespace {

/// One box side (or frame side): a segment at pos spanning [from, to].
struct Boundary {
    float pos;
    float from;
    float to;
    NodeId node;  ///< INVALID_NODE for the frame
};

struct Boundaries {
    std::vector<Boundary> left;    ///< x = min.x of boxes, frame right wall
    std::vector<Boundary> right;   ///< x = max.x of boxes, frame left wall
    std::vector<Boundary> top;     ///< y = min.y of boxes, frame bottom wall
    std::vector<Boundary> bottom;  ///< y = max.y of boxes, frame top wall
};

Boundaries collectBoundaries(const std::vector<Rect>& boxes, float margin) {
    Boundaries b;
    Rect frame = Rect::nothing();
    for (NodeId i = 0; i < boxes.size(); ++i) {
        const Rect& box = boxes[i];
        frame = frame.united(box);
        b.left.push_back({box.left(), box.top(), box.bottom(), i});
        b.right.push_back({box.right(), box.top(), box.bottom(), i});
        b.top.push_back({box.top(), box.left(), box.right(), i});
        b.bottom.push_back({box.bottom(), box.left(), box.right(), i});
    }
    frame = frame.expanded(margin);
    b.left.push_back({frame.right(), frame.top(), frame.bottom(), INVALID_NODE});
    b.right.push_back({frame.left(), frame.top(), frame.bottom(), INVALID_NODE});
    b.top.push_back({frame.bottom(), frame.left(), frame.right(), INVALID_NODE});
    b.bottom.push_back({frame.top(), frame.left(), frame.right(), INVALID_NODE});

    auto byPos = [](const Boundary& l, const Boundary& r) { return l.pos < r.pos; };
    std::stable_sort(b.left.begin(), b.left.end(), byPos);
    std::stable_sort(b.right.begin(), b.right.end(), byPos);
    std::stable_sort(b.top.begin(), b.top.end(), byPos);
    std::stable_sort(b.bottom.begin(), b.bottom.end(), byPos);
    return b;
}

bool spans(const Boundary& b, float v) { return b.from <= v && v <= b.to; }

void mergeInto(Channel& target, const Channel& other) {
    Rect& r = target.rect;
    const Rect& o = other.rect;
    if (target.orientation == Orientation::Vertical) {
        r = Rect(std::max(r.min.x, o.min.x), std::min(r.min.y, o.min.y),
                 std::min(r.max.x, o.max.x), std::max(r.max.y, o.max.y));
    } else {
        r = Rect(std::min(r.min.x, o.min.x), std::max(r.min.y, o.min.y),
                 std::max(r.max.x, o.max.x), std::min(r.max.y, o.max.y));
    }
    target.ports.insert(target.ports.end(), other.ports.begin(), other.ports.end());
}

// Merge into the first touching channel, else append. A merged channel grows
// and keeps absorbing channels it now touches.
void addChannel(std::vector<Channel>& channels, Channel channel) {
    auto touches = [&](const Channel& c) { return c.rect.intersects(channel.rect); };
    auto first = std::find_if(channels.begin(), channels.end(), touches);
    if (first == channels.end()) {
        channels.push_back(std::move(channel));
        return;
    }
    size_t target = static_cast<size_t>(first - channels.begin());
    mergeInto(channels[target], channel);

    bool merged = true;
    while (merged) {
        merged = false;
        for (size_t j = 0; j < channels.size(); ++j) {
            if (j == target || !channels[j].rect.intersects(channels[target].rect)) {
                continue;
            }
            mergeInto(channels[target], channels[j]);
            channels.erase(channels.begin() + static_cast<std::ptrdiff_t>(j));
            if (j < target) {
                --target;
            }
            merged = true;
            break;
        }
    }
}

void addSidePort(Channel& channel, const Boundary& wall, Side side, const std::vector<Rect>& boxes) {
    if (wall.node == INVALID_NODE) {
        return;
    }
    ChannelPort port;
    port.kind = ChannelPortKind::NodeSide;
    port.node = wall.node;
    port.side = side;
    port.position = portCoordinate(boxes[wall.node], side);
    channel.ports.push_back(port);
}

// Vertical channel whose right wall is the given left side of a box.
std::optional<Rect> channelLeftOf(const Boundary& rightWall, const Boundaries& b) {
    for (auto top = b.bottom.rbegin(); top != b.bottom.rend(); ++top) {
        if (top->pos > rightWall.from || !spans(*top, rightWall.pos)) {
            continue;
        }
        for (const auto& bottom : b.top) {
            if (bottom.pos < rightWall.to || !spans(bottom, rightWall.pos)) {
                continue;
            }
            for (auto left = b.right.rbegin(); left != b.right.rend(); ++left) {
                if (left->pos > rightWall.pos) {
                    continue;
                }
                if (left->from <= bottom.pos && top->pos <= left->to) {
                    return Rect(left->pos, top->pos, rightWall.pos, bottom.pos);
                }
            }
        }
    }
    return std::nullopt;
}

// Vertical channel whose left wall is the given right side of a box.
std::optional<Rect> channelRightOf(const Boundary& leftWall, const Boundaries& b) {
    for (auto top = b.bottom.rbegin(); top != b.bottom.rend(); ++top) {
        if (top->pos > leftWall.from || !spans(*top, leftWall.pos)) {
            continue;
        }
        for (const auto& bottom : b.top) {
            if (bottom.pos < leftWall.to || !spans(bottom, leftWall.pos)) {
                continue;
            }
            for (const auto& right : b.left) {
                if (leftWall.pos > right.pos) {
                    continue;
                }
                if (right.from <= bottom.pos && top->pos <= right.to) {
                    return Rect(leftWall.pos, top->pos, right.pos, bottom.pos);
                }
            }
        }
    }
    return std::nullopt;
}

// Horizontal channel whose bottom wall is the given top side of a box.
std::optional<Rect> channelAbove(const Boundary& bottomWall, const Boundaries& b) {
    for (auto left = b.right.rbegin(); left != b.right.rend(); ++left) {
        if (left->pos > bottomWall.from || !spans(*left, bottomWall.pos)) {
            continue;
        }
        for (const auto& right : b.left) {
            if (right.pos < bottomWall.to || !spans(right, bottomWall.pos)) {
                continue;
            }
            for (auto top = b.bottom.rbegin(); top != b.bottom.rend(); ++top) {
                if (top->pos > bottomWall.pos) {
                    continue;
                }
                if (top->from <= right.pos && left->pos <= top->to) {
                    return Rect(left->pos, top->pos, right.pos, bottomWall.pos);
                }
            }
        }
    }
    return std::nullopt;
}

// Horizontal channel whose top wall is the given bottom side of a box.
std::optional<Rect> channelBelow(const Boundary& topWall, const Boundaries& b) {
    for (auto left = b.right.rbegin(); left != b.right.rend(); ++left) {
        if (left->pos > topWall.from || !spans(*left, topWall.pos)) {
            continue;
        }
        for (const auto& right : b.left) {
            if (right.pos < topWall.to || !spans(right, topWall.pos)) {
                continue;
            }
            for (const auto& bottom : b.top) {
                if (topWall.pos > bottom.pos) {
                    continue;
                }
                if (bottom.from <= right.pos && left->pos <= bottom.to) {
                    return Rect(left->pos, topWall.pos, right.pos, bottom.pos);
                }
            }
        }
    }
    return std::nullopt;
}

void sortPorts(std::vector<Channel>& channels) {
    for (auto& channel : channels) {
        std::stable_sort(channel.ports.begin(), channel.ports.end(),
                         [](const ChannelPort& l, const ChannelPort& r) { return l.position < r.position; });
    }
}

}  // namespace

ChannelSet ChannelBuilder::buildChannels(const std::vector<Rect>& boxes, float frameMargin) {
    ChannelSet result;
    if (boxes.empty()) {
        return result;
    }

    const Boundaries b = collectBoundaries(boxes, frameMargin);

    for (const auto& wall : b.left) {
        if (auto rect = channelLeftOf(wall, b)) {
            Channel channel{*rect, Orientation::Vertical, {}};
            addSidePort(channel, wall, Side::Left, boxes);
            addChannel(result.vertical, std::move(channel));
        }
    }
    for (const auto& wall : b.right) {
        if (auto rect = channelRightOf(wall, b)) {
            Channel channel{*rect, Orientation::Vertical, {}};
            addSidePort(channel, wall, Side::Right, boxes);
            addChannel(result.vertical, std::move(channel));
        }
    }
    for (const auto& wall : b.top) {
        if (auto rect = channelAbove(wall, b)) {
            Channel channel{*rect, Orientation::Horizontal, {}};
            addSidePort(channel, wall, Side::Top, boxes);
            addChannel(result.horizontal, std::move(channel));
        }
    }
    for (const auto& wall : b.bottom) {
        if (auto rect = channelBelow(wall, b)) {
            Channel channel{*rect, Orientation::Horizontal, {}};
            addSidePort(channel, wall, Side::Bottom, boxes);
            addChannel(result.horizontal, std::move(channel));
        }
    }

    sortPorts(result.vertical);
    sortPorts(result.horizontal);

    LOG_DEBUG("{} boxes -> {} vertical, {} horizontal channels",
              boxes.size(), result.vertical.size(), result.horizontal.size());
    return result;
}

}  // namespace nodeweave
