#pragma once

#include "nodeweave/core/Graph.h"
#include "nodeweave/force/ForceLayout.h"
#include "nodeweave/ortho/ChannelBuilder.h"
#include "nodeweave/ortho/SlotAssigner.h"

#include <vector>

namespace nodeweave {

struct OrthoOptions {
    float laneMargin = 20.0f;    ///< Channel width with no lanes
    float laneSpacing = 8.0f;    ///< Extra width per lane
    float frameMargin = ChannelBuilder::DEFAULT_FRAME_MARGIN;
};

/// Rectilinear polyline of one edge.
struct EdgeRoute {
    size_t edgeIndex = 0;  ///< Input edge index, or edge id for the graph overload
    NodeId from = 0;
    NodeId to = 0;
    std::vector<Point> points;
    std::vector<uint32_t> channelSlots;  ///< Lane per route vertex, see EdgeSlots
};

struct OrthoResult {
    std::vector<Rect> rects;             ///< Boxes after channel resizing
    std::vector<EdgeRoute> edgeRoutes;
    std::vector<uint32_t> channelSlots;  ///< Lanes per channel, vertical first
    size_t detectedCycles = 0;
};

/**
 * @brief Routes edges as axis-parallel polylines between node boxes.
 *
 * Pipeline: build channels, create the routing graph, find routes, assign
 * lanes and port slots, widen channels to laneMargin + lanes * laneSpacing
 * (moving boxes as needed), then turn routes into polylines on the resized
 * geometry. Self loops are not routed.
 */
class OrthogonalRouter {
public:
    /// @throws std::invalid_argument for an edge endpoint outside rects
    static OrthoResult route(const std::vector<Rect>& rects,
                             const std::vector<OrthoEdge>& edges,
                             const OrthoOptions& options = {});

    /// Boxes from node positions and sizes, visible edges only.
    /// @throws std::invalid_argument if positions.size() != graph.nodeCount()
    static OrthoResult route(const LayoutGraph& graph,
                             const std::vector<NodePosition>& positions,
                             const OrthoOptions& options = {});

    /// Move node centers to the resized boxes.
    static void applyPositions(const OrthoResult& result, std::vector<NodePosition>& positions);

    /// Polyline per assigned edge on the current channel and box geometry.
    static std::vector<std::vector<Point>> buildPolylines(const RoutingGraph& graph,
                                                          const std::vector<Rect>& boxes,
                                                          const std::vector<Route>& routes,
                                                          const SlotAssignment& slots);
};

}  // namespace nodeweave
