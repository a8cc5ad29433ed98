#include "nodeweave/community/Louvain.h"
#include "nodeweave/common/Logger.h"

#include <random>

namespace nodeweave {

ClusterResult Louvain::run(size_t nodeCount, const std::vector<EdgeData>& edges,
                           const LouvainOptions& options) {
    ClusterResult result;
    if (nodeCount == 0) {
        return result;
    }

    CommunityModel model(nodeCount, edges, options.resolution);
    std::mt19937 rng(options.seed);

    int levels = 0;
    bool someChange = true;
    while (someChange) {
        someChange = false;
        bool localChange = true;
        while (localChange) {
            uint32_t start = 0;
            if (options.randomize) {
                std::uniform_int_distribution<uint32_t> pick(
                    0, static_cast<uint32_t>(model.nodeCount() - 1));
                start = pick(rng);
            }
            localChange = model.sweep(start);
            someChange = someChange || localChange;
        }
        if (someChange) {
            model.mergeNodes();
            ++levels;
        }
    }

    result.clusterCount = static_cast<uint32_t>(model.communityCount());
    result.nodeCluster = model.originCommunities();
    LOG_DEBUG("{} nodes, {} edges -> {} communities after {} levels", nodeCount, edges.size(),
              result.clusterCount, levels);
    return result;
}

ClusterResult Louvain::run(const LayoutGraph& graph, const LouvainOptions& options) {
    return run(graph.nodeCount(), graph.visibleEdges(), options);
}

}  // namespace nodeweave
