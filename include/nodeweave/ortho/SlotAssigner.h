#pragma once

#include "nodeweave/ortho/RouteFinder.h"

#include <cstdint>
#include <vector>

namespace nodeweave {

/// Slot indices of one graph edge along its route. Both vectors are indexed
/// like Route::vertices: portSlots at port positions, channelSlots at the
/// index of the vertex that starts each channel leg.
struct EdgeSlots {
    size_t routeIndex = 0;
    size_t edgeIndex = 0;
    std::vector<uint32_t> portSlots;
    std::vector<uint32_t> channelSlots;
};

struct SlotAssignment {
    std::vector<EdgeSlots> edges;            ///< One per input edge, same order
    std::vector<uint32_t> portSlotCounts;    ///< Indexed node * 4 + side
    std::vector<uint32_t> channelSlots;      ///< Lanes per channel, vertical first
    size_t detectedCycles = 0;
};

/**
 * @brief Assigns parallel lanes in channels and attachment slots on box
 *        sides so routes sharing a channel do not cross needlessly.
 *
 * Each edge's route is split into channel legs. A channel needs as many
 * lanes as legs overlap at any point. Legs are ordered by how their ends
 * attach to the channel walls; pairwise orders become route precedences
 * that a RouteOrderResolver turns into one global route order.
 */
class SlotAssigner {
public:
    /// Edges may repeat; every edge must have a route in routes.
    /// @throws std::logic_error for an edge without a route
    static SlotAssignment assign(const RoutingGraph& graph,
                                 const std::vector<Rect>& boxes,
                                 const std::vector<OrthoEdge>& edges,
                                 const std::vector<Route>& routes);
};

}  // namespace nodeweave
