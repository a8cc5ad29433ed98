#pragma once

#include "nodeweave/ortho/OrthoTypes.h"

#include <vector>

namespace nodeweave {

/**
 * @brief Widens channels to a minimum width and pushes everything to their
 *        right (or below) out of the way.
 *
 * Runs once along x for vertical channels and once along y for horizontal
 * channels. Each pass works through a worklist of pending moves
 * (AddChannelWidth, MoveBox, MoveChannel); consequences are pushed to the
 * front so a chain of dependent boxes and channels settles before the next
 * widening starts. Moves only ever increase coordinates, so the worklist
 * reaches a fixed point.
 *
 * Boxes that share a span across the pass axis keep their order: once the
 * worklist drains, any box caught up by the box before it is moved past it
 * with their original gap, and the worklist runs again.
 */
class ChannelResizer {
public:
    /// @throws std::invalid_argument if a width vector does not match its
    ///         channel list or a port references an unknown box
    static void resize(std::vector<Rect>& boxes,
                       ChannelSet& channels,
                       const std::vector<float>& minWidthsVertical,
                       const std::vector<float>& minWidthsHorizontal);
};

}  // namespace nodeweave
