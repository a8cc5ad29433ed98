#pragma once

#include "nodeweave/layout/OrderingUtils.h"

#include <cstdint>
#include <vector>

namespace nodeweave {

struct LinearOptions {
    LayoutOrientation orientation = LayoutOrientation::Horizontal;
    float spacing = 50.0f;          ///< Gap between consecutive nodes
    float duplicateOffset = 5.0f;   ///< Extra curvature per parallel edge
    uint32_t seed = 0;
};

/**
 * @brief Lines nodes up along one axis.
 *
 * Components with more than two nodes are ordered by a random depth-first
 * walk from their least connected node; smaller components follow in
 * selection order. Nodes are packed from the left (or top) edge of the
 * selection's bounding box and centered on the other axis. Edge curvature
 * is set so arcs between distant nodes clear the nodes in between.
 */
class LinearLayout {
public:
    /// Selections with fewer than three nodes use every node in the graph.
    /// @throws std::invalid_argument if positions.size() != graph.nodeCount()
    static void apply(LayoutGraph& graph,
                      std::vector<NodePosition>& positions,
                      const std::vector<NodeId>& selection,
                      const LinearOptions& options = {});

    /// Curvature for the duplicate-th parallel edge between order slots
    /// fromIndex and toIndex.
    static float edgeCurvature(size_t fromIndex, size_t toIndex, size_t duplicate,
                               const LinearOptions& options = {});
};

}  // namespace nodeweave
