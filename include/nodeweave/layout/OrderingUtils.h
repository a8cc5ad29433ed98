#pragma once

#include "nodeweave/core/Graph.h"
#include "nodeweave/force/ForceLayout.h"

#include <cstdint>
#include <map>
#include <random>
#include <vector>

namespace nodeweave {

/// Undirected edge between two node ids used by the ordering layouts.
struct OrderEdge {
    NodeId from = 0;
    NodeId to = 0;
};

using AdjacencyMap = std::map<NodeId, std::vector<NodeId>>;

enum class LayoutOrientation {
    Horizontal,
    Vertical
};

/// Helpers shared by CircularLayout and LinearLayout.
class OrderingUtils {
public:
    /// Connected components of nodes, considering only edges with both
    /// endpoints in nodes. Components are returned in order of their first
    /// node in nodes, members in nodes order.
    static std::vector<std::vector<NodeId>> findComponents(const std::vector<OrderEdge>& edges,
                                                           const std::vector<NodeId>& nodes);

    static AdjacencyMap buildAdjacency(const std::vector<OrderEdge>& edges);

    /// Node with the fewest neighbors (lowest id on ties).
    /// @throws std::invalid_argument when adjacency is empty
    static NodeId leastConnectedNode(const AdjacencyMap& adjacency);

    /// Depth-first visit order with neighbors pushed in shuffled order.
    static std::vector<NodeId> randomDfs(const AdjacencyMap& adjacency, NodeId start,
                                         std::mt19937& rng);

    /// Sorted, de-duplicated node ids that exist in the graph.
    static std::vector<NodeId> validSelection(const LayoutGraph& graph,
                                              const std::vector<NodeId>& selection);

    /// Visible edges with both endpoints in the sorted node list.
    static std::vector<OrderEdge> edgesWithin(const LayoutGraph& graph,
                                              const std::vector<NodeId>& sortedNodes);

    /// Bounding box of the positions of the given nodes.
    static Rect boundsOf(const std::vector<NodePosition>& positions,
                         const std::vector<NodeId>& nodes);
};

}  // namespace nodeweave
