#pragma once

#include "nodeweave/core/Graph.h"

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace nodeweave {

using CommunityId = uint32_t;

/// Weighted half-edge of the current coarsening level.
struct WeightedEdge {
    uint32_t to = 0;
    double weight = 1.0;
};

/// Louvain node: community membership plus the shared weight towards each
/// neighboring community. sum(communities) + selfWeight == degree.
struct CommunityNode {
    CommunityId communityId = 0;
    double degree = 0.0;
    double selfWeight = 0.0;
    std::map<CommunityId, double> communities;
};

struct Community {
    std::vector<uint32_t> nodes;
    double totalDegree = 0.0;
    CommunityId nextId = 0;  ///< Id in the next coarsening level
};

/**
 * @brief Incremental modularity state for one Louvain coarsening level
 *
 * Every node starts in its own community. Moving a node only touches the
 * caches of its neighbors, so a move costs O(degree). mergeNodes()
 * collapses each non-empty community into one node of the next level and
 * keeps the original-node to community mapping up to date.
 */
class CommunityModel {
public:
    CommunityModel(size_t nodeCount, const std::vector<EdgeData>& edges, double resolution = 1.0);

    /// Modularity gain of moving node into community given the shared weight.
    /// For the node's own community this is the gain of staying, computed as
    /// if the node had been removed first.
    double gain(uint32_t node, CommunityId community, double sharedWeight) const;

    /// Neighboring community with the best strictly positive gain. Ties keep
    /// the lowest community id.
    std::optional<CommunityId> findBestCommunity(uint32_t node) const;

    void moveNode(uint32_t node, CommunityId community);

    /// One round-robin pass over all nodes starting at start.
    /// @return true if any node changed community
    bool sweep(uint32_t start);

    /// Collapse communities into the nodes of the next level.
    void mergeNodes();

    /// Community of every original node at the current level.
    std::vector<CommunityId> currentPartition() const;

    size_t nodeCount() const { return nodes_.size(); }
    size_t communityCount() const { return communities_.size(); }
    const CommunityNode& node(uint32_t id) const { return nodes_.at(id); }
    const Community& community(CommunityId id) const { return communities_.at(id); }
    const std::vector<WeightedEdge>& edgesOf(uint32_t id) const { return edges_.at(id); }
    const std::vector<CommunityId>& originCommunities() const { return origin_; }
    double totalWeight() const { return m_; }
    double resolution() const { return resolution_; }

private:
    void initCaches();

    double m_ = 0.0;  // sum of directed edge weights (2|E| at level 0)
    double resolution_;
    std::vector<CommunityId> origin_;
    std::vector<CommunityNode> nodes_;
    std::vector<Community> communities_;
    std::vector<std::vector<WeightedEdge>> edges_;
};

/// Newman modularity of a partition over unit-weight edges.
double computeModularity(size_t nodeCount, const std::vector<EdgeData>& edges,
                         const std::vector<CommunityId>& partition);

}  // namespace nodeweave
