#pragma once

#include "nodeweave/ortho/OrthoTypes.h"

#include <vector>

namespace nodeweave {

/**
 * @brief Partitions the free space around node boxes into channels.
 *
 * For every box side, plus a frame around all boxes, the builder sweeps
 * the other sides to find the tightest free rectangle bounded by that side
 * and records the side as a port of the channel. Channels of one
 * orientation that touch are merged, so same-orientation channels never
 * overlap.
 */
class ChannelBuilder {
public:
    static constexpr float DEFAULT_FRAME_MARGIN = 20.0f;

    /// Boxes must not overlap. Ports of each channel end up sorted by position.
    static ChannelSet buildChannels(const std::vector<Rect>& boxes,
                                    float frameMargin = DEFAULT_FRAME_MARGIN);
};

}  // namespace nodeweave
