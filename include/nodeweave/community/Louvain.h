#pragma once

#include "nodeweave/community/CommunityModel.h"
#include "nodeweave/core/Graph.h"

#include <cstdint>
#include <vector>

namespace nodeweave {

struct LouvainOptions {
    double resolution = 1.0;  ///< gamma; larger values favor smaller communities
    bool randomize = true;    ///< Start each sweep at a random node
    uint32_t seed = 0;        ///< Seed for the start node when randomize is set
};

struct ClusterResult {
    uint32_t clusterCount = 0;
    std::vector<CommunityId> nodeCluster;  ///< Community id per original node
};

/// Louvain community detection: local-move sweeps until no node moves, then
/// coarsening, repeated until a whole level produces no move.
class Louvain {
public:
    static ClusterResult run(size_t nodeCount, const std::vector<EdgeData>& edges,
                             const LouvainOptions& options = {});

    /// Runs on the visible edges of the graph.
    static ClusterResult run(const LayoutGraph& graph, const LouvainOptions& options = {});
};

}  // namespace nodeweave
