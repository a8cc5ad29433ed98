#include "nodeweave/ortho/ChannelResizer.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace nodeweave {

namespace {

constexpr size_t NO_CHANNEL = SIZE_MAX;

struct PendingMove {
    enum class Kind {
        MoveBox,
        MoveChannel,
        AddChannelWidth
    };
    Kind kind;
    float value;  ///< New minimum for moves, width increase for AddChannelWidth
    size_t index;
};

/// Pass along x: vertical channels widen, boxes and channels shift right.
struct AxisX {
    static constexpr const char* NAME = "x";
    static constexpr Side NEAR_SIDE = Side::Left;   ///< Box sides facing a channel on their left
    static constexpr Side FAR_SIDE = Side::Right;
    static float min(const Rect& r) { return r.min.x; }
    static float max(const Rect& r) { return r.max.x; }
    static void setMax(Rect& r, float v) { r.max.x = v; }
    static float addMax(Rect& r, float d) { r.max.x += d; return r.max.x; }
    static float shift(Rect& r, float d) { r.min.x += d; r.max.x += d; return r.max.x; }
    /// Strict overlap of the y spans.
    static bool sharesSpan(const Rect& a, const Rect& b) { return a.min.y < b.max.y && b.min.y < a.max.y; }
    static std::vector<Channel>& channels(ChannelSet& s) { return s.vertical; }
    static std::vector<Channel>& crossing(ChannelSet& s) { return s.horizontal; }
};

/// Pass along y: horizontal channels grow, boxes and channels shift down.
struct AxisY {
    static constexpr const char* NAME = "y";
    static constexpr Side NEAR_SIDE = Side::Top;
    static constexpr Side FAR_SIDE = Side::Bottom;
    static float min(const Rect& r) { return r.min.y; }
    static float max(const Rect& r) { return r.max.y; }
    static void setMax(Rect& r, float v) { r.max.y = v; }
    static float addMax(Rect& r, float d) { r.max.y += d; return r.max.y; }
    static float shift(Rect& r, float d) { r.min.y += d; r.max.y += d; return r.max.y; }
    static bool sharesSpan(const Rect& a, const Rect& b) { return a.min.x < b.max.x && b.min.x < a.max.x; }
    static std::vector<Channel>& channels(ChannelSet& s) { return s.horizontal; }
    static std::vector<Channel>& crossing(ChannelSet& s) { return s.vertical; }
};

/// Crossing (vertical, horizontal) channel pairs.
using Crossings = std::vector<std::pair<size_t, size_t>>;

/// Two boxes sharing a span across the pass axis, `before` ending at or
/// ahead of where `after` starts.
struct OrderedPair {
    size_t before;
    size_t after;
    float gap;
};

template <typename Axis>
void pushBoxesBeyond(const Channel& channel, float newMax, const std::vector<Rect>& boxes,
                     std::deque<PendingMove>& moves) {
    for (const auto& port : channel.ports) {
        if (port.kind != ChannelPortKind::NodeSide || port.side != Axis::NEAR_SIDE) {
            continue;
        }
        if (newMax - Axis::min(boxes[port.node]) > 0.0f) {
            moves.push_front({PendingMove::Kind::MoveBox, newMax, port.node});
        }
    }
}

/// Runs the worklist to a fixed point. Returns the number of moves taken.
template <typename Axis>
size_t drainMoves(std::vector<Rect>& boxes, std::vector<Channel>& channels,
                  const std::vector<size_t>& farChannel, std::deque<PendingMove>& moves) {
    size_t processed = 0;
    while (!moves.empty()) {
        const PendingMove move = moves.front();
        moves.pop_front();
        ++processed;
        switch (move.kind) {
            case PendingMove::Kind::MoveBox: {
                Rect& box = boxes[move.index];
                const float delta = move.value - Axis::min(box);
                if (delta <= 0.0f) {
                    break;
                }
                const float newMax = Axis::shift(box, delta);
                const size_t far = farChannel[move.index];
                if (far != NO_CHANNEL && newMax - Axis::min(channels[far].rect) > 0.0f) {
                    moves.push_front({PendingMove::Kind::MoveChannel, newMax, far});
                }
                break;
            }
            case PendingMove::Kind::MoveChannel: {
                Channel& channel = channels[move.index];
                const float delta = move.value - Axis::min(channel.rect);
                if (delta <= 0.0f) {
                    break;
                }
                const float newMax = Axis::shift(channel.rect, delta);
                pushBoxesBeyond<Axis>(channel, newMax, boxes, moves);
                break;
            }
            case PendingMove::Kind::AddChannelWidth: {
                Channel& channel = channels[move.index];
                const float newMax = Axis::addMax(channel.rect, move.value);
                pushBoxesBeyond<Axis>(channel, newMax, boxes, moves);
                break;
            }
        }
    }
    return processed;
}

template <typename Axis>
void resizeAxis(std::vector<Rect>& boxes, ChannelSet& set, const std::vector<float>& minWidths,
                const Crossings& crossings, bool verticalFirst) {
    std::vector<Channel>& channels = Axis::channels(set);
    std::vector<Channel>& crossing = Axis::crossing(set);

    std::deque<PendingMove> moves;
    for (size_t i = 0; i < channels.size(); ++i) {
        const float delta = minWidths[i] - channels[i].width();
        if (delta > 0.0f) {
            moves.push_back({PendingMove::Kind::AddChannelWidth, delta, i});
        }
    }

    // Channel directly beyond each box.
    std::vector<size_t> farChannel(boxes.size(), NO_CHANNEL);
    for (size_t ci = 0; ci < channels.size(); ++ci) {
        for (const auto& port : channels[ci].ports) {
            if (port.kind != ChannelPortKind::NodeSide) {
                continue;
            }
            if (port.node >= boxes.size()) {
                throw std::invalid_argument("Channel port references unknown box " +
                                            std::to_string(port.node));
            }
            if (port.side == Axis::FAR_SIDE) {
                farChannel[port.node] = ci;
            }
        }
    }

    // Crossing channels that end flush with this channel keep doing so.
    std::map<size_t, std::vector<size_t>> flush;
    for (const auto& [v, h] : crossings) {
        const size_t ci = verticalFirst ? v : h;
        const size_t oi = verticalFirst ? h : v;
        if (Axis::max(channels[ci].rect) == Axis::max(crossing[oi].rect)) {
            flush[ci].push_back(oi);
        }
    }

    // Boxes in line along this axis keep their order and original gap.
    std::vector<OrderedPair> ordered;
    for (size_t a = 0; a < boxes.size(); ++a) {
        for (size_t b = 0; b < boxes.size(); ++b) {
            if (a != b && Axis::sharesSpan(boxes[a], boxes[b]) &&
                Axis::max(boxes[a]) <= Axis::min(boxes[b])) {
                ordered.push_back({a, b, Axis::min(boxes[b]) - Axis::max(boxes[a])});
            }
        }
    }

    size_t processed = drainMoves<Axis>(boxes, channels, farChannel, moves);
    size_t separated = 0;
    bool changed = true;
    while (changed) {
        changed = false;
        std::sort(ordered.begin(), ordered.end(), [&](const OrderedPair& l, const OrderedPair& r) {
            return Axis::min(boxes[l.before]) < Axis::min(boxes[r.before]);
        });
        for (const auto& pair : ordered) {
            const float frontier = Axis::max(boxes[pair.before]);
            if (Axis::min(boxes[pair.after]) < frontier) {
                moves.push_back({PendingMove::Kind::MoveBox, frontier + pair.gap, pair.after});
                processed += drainMoves<Axis>(boxes, channels, farChannel, moves);
                ++separated;
                changed = true;
            }
        }
    }

    for (const auto& [ci, crossingIds] : flush) {
        const float edge = Axis::max(channels[ci].rect);
        for (size_t oi : crossingIds) {
            Axis::setMax(crossing[oi].rect, edge);
        }
    }

    LOG_DEBUG("Resize along {} processed {} moves, separated {} boxes", Axis::NAME, processed,
              separated);
}

}  // namespace

void ChannelResizer::resize(std::vector<Rect>& boxes,
                            ChannelSet& channels,
                            const std::vector<float>& minWidthsVertical,
                            const std::vector<float>& minWidthsHorizontal) {
    if (minWidthsVertical.size() != channels.vertical.size() ||
        minWidthsHorizontal.size() != channels.horizontal.size()) {
        throw std::invalid_argument("Minimum widths (" + std::to_string(minWidthsVertical.size()) +
                                    ", " + std::to_string(minWidthsHorizontal.size()) +
                                    ") do not match channels (" +
                                    std::to_string(channels.vertical.size()) + ", " +
                                    std::to_string(channels.horizontal.size()) + ")");
    }

    // Crossings are taken from the layout before any channel moves.
    Crossings crossings;
    for (size_t v = 0; v < channels.vertical.size(); ++v) {
        for (size_t h = 0; h < channels.horizontal.size(); ++h) {
            if (channels.vertical[v].rect.intersects(channels.horizontal[h].rect)) {
                crossings.emplace_back(v, h);
            }
        }
    }

    resizeAxis<AxisX>(boxes, channels, minWidthsVertical, crossings, true);
    resizeAxis<AxisY>(boxes, channels, minWidthsHorizontal, crossings, false);
}

}  // namespace nodeweave
