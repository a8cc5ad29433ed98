#include "nodeweave/community/CommunityModel.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace nodeweave {

CommunityModel::CommunityModel(size_t nodeCount, const std::vector<EdgeData>& edges,
                               double resolution)
    : m_(static_cast<double>(edges.size()) * 2.0), resolution_(resolution) {
    origin_.resize(nodeCount);
    nodes_.resize(nodeCount);
    communities_.resize(nodeCount);
    edges_.resize(nodeCount);

    for (uint32_t i = 0; i < nodeCount; ++i) {
        origin_[i] = i;
        nodes_[i].communityId = i;
        communities_[i].nodes = {i};
    }

    for (const auto& edge : edges) {
        if (edge.from >= nodeCount || edge.to >= nodeCount) {
            throw std::invalid_argument("Edge endpoint out of range: " + std::to_string(edge.from) +
                                        " -> " + std::to_string(edge.to));
        }
        edges_[edge.from].push_back({edge.to, 1.0});
        edges_[edge.to].push_back({edge.from, 1.0});
    }

    initCaches();
}

void CommunityModel::initCaches() {
    for (uint32_t i = 0; i < nodes_.size(); ++i) {
        CommunityNode& node = nodes_[i];
        node.communities.clear();
        double sum = node.selfWeight;
        for (const auto& edge : edges_[i]) {
            sum += edge.weight;
            node.communities[nodes_[edge.to].communityId] += edge.weight;
        }
        node.degree = sum;
    }

    for (auto& community : communities_) {
        community.totalDegree = 0.0;
        for (uint32_t member : community.nodes) {
            community.totalDegree += nodes_[member].degree;
        }
    }
}

double CommunityModel::gain(uint32_t nodeId, CommunityId communityId, double sharedWeight) const {
    // dq = (resolution * d_ij - d_i * d_j / (2m)) / m with m = m_ / 2 and
    // d_ij doubled to match the symmetric adjacency.
    const CommunityNode& node = nodes_[nodeId];
    const Community& community = communities_[communityId];
    const double di = node.degree;
    double dj = community.totalDegree;
    if (node.communityId == communityId) {
        if (community.nodes.size() == 1) {
            return 0.0;
        }
        dj -= di;
    }
    const double dij = sharedWeight * 2.0;
    return (resolution_ * dij - (di * dj) / (m_ * 0.5)) / m_;
}

std::optional<CommunityId> CommunityModel::findBestCommunity(uint32_t nodeId) const {
    double best = 0.0;
    std::optional<CommunityId> bestCommunity;
    for (const auto& [communityId, shared] : nodes_[nodeId].communities) {
        if (shared <= 0.0) {
            continue;
        }
        const double q = gain(nodeId, communityId, shared);
        if (q > best) {
            best = q;
            bestCommunity = communityId;
        }
    }
    return bestCommunity;
}

void CommunityModel::moveNode(uint32_t nodeId, CommunityId communityId) {
    CommunityNode& node = nodes_[nodeId];
    const CommunityId oldId = node.communityId;
    if (oldId == communityId) {
        return;
    }

    Community& oldCommunity = communities_[oldId];
    auto pos = std::find(oldCommunity.nodes.begin(), oldCommunity.nodes.end(), nodeId);
    if (pos == oldCommunity.nodes.end()) {
        throw std::logic_error("Node " + std::to_string(nodeId) + " missing from community " +
                               std::to_string(oldId));
    }
    *pos = oldCommunity.nodes.back();
    oldCommunity.nodes.pop_back();
    oldCommunity.totalDegree -= node.degree;

    Community& newCommunity = communities_[communityId];
    newCommunity.nodes.push_back(nodeId);
    newCommunity.totalDegree += node.degree;

    for (const auto& edge : edges_[nodeId]) {
        auto& cache = nodes_[edge.to].communities;
        auto it = cache.find(oldId);
        if (it != cache.end()) {
            it->second -= edge.weight;
            if (it->second <= 0.0) {
                cache.erase(it);
            }
        }
        cache[communityId] += edge.weight;
    }

    node.communityId = communityId;
}

bool CommunityModel::sweep(uint32_t start) {
    const uint32_t count = static_cast<uint32_t>(nodes_.size());
    if (count == 0) {
        return false;
    }
    bool moved = false;
    uint32_t nodeId = start % count;
    for (uint32_t step = 0; step < count; ++step) {
        auto best = findBestCommunity(nodeId);
        if (best && *best != nodes_[nodeId].communityId) {
            moveNode(nodeId, *best);
            moved = true;
        }
        nodeId = (nodeId + 1) % count;
    }
    return moved;
}

void CommunityModel::mergeNodes() {
    CommunityId nextCount = 0;
    for (auto& community : communities_) {
        if (!community.nodes.empty()) {
            community.nextId = nextCount++;
        }
    }

    std::vector<Community> newCommunities;
    std::vector<CommunityNode> newNodes;
    std::vector<std::vector<WeightedEdge>> newEdges(nextCount);
    newCommunities.reserve(nextCount);
    newNodes.reserve(nextCount);
    double m = 0.0;

    for (const auto& community : communities_) {
        if (community.nodes.empty()) {
            continue;
        }
        const CommunityId newId = community.nextId;

        Community merged;
        merged.nodes = {newId};
        newCommunities.push_back(std::move(merged));

        std::map<CommunityId, double> linked;
        double selfWeight = 0.0;
        for (uint32_t member : community.nodes) {
            for (const auto& edge : edges_[member]) {
                const CommunityId neighborCommunity = nodes_[edge.to].communityId;
                linked[communities_[neighborCommunity].nextId] += edge.weight;
            }
            selfWeight += nodes_[member].selfWeight;
        }

        for (const auto& [target, weight] : linked) {
            m += weight;
            if (target == newId) {
                selfWeight += weight;
            } else {
                newEdges[newId].push_back({target, weight});
            }
        }

        CommunityNode node;
        node.communityId = newId;
        node.selfWeight = selfWeight;
        newNodes.push_back(std::move(node));
    }

    for (auto& origin : origin_) {
        origin = communities_[nodes_[origin].communityId].nextId;
    }

    LOG_DEBUG("Coarsened {} nodes into {}", nodes_.size(), nextCount);

    communities_ = std::move(newCommunities);
    nodes_ = std::move(newNodes);
    edges_ = std::move(newEdges);
    m_ = m;
    initCaches();
}

std::vector<CommunityId> CommunityModel::currentPartition() const {
    std::vector<CommunityId> partition;
    partition.reserve(origin_.size());
    for (CommunityId origin : origin_) {
        partition.push_back(nodes_[origin].communityId);
    }
    return partition;
}

double computeModularity(size_t nodeCount, const std::vector<EdgeData>& edges,
                         const std::vector<CommunityId>& partition) {
    if (edges.empty() || partition.size() != nodeCount) {
        return 0.0;
    }
    const double m = static_cast<double>(edges.size());

    std::vector<double> degree(nodeCount, 0.0);
    std::map<CommunityId, double> internal;
    std::map<CommunityId, double> total;
    for (const auto& edge : edges) {
        degree[edge.from] += 1.0;
        degree[edge.to] += 1.0;
        if (partition[edge.from] == partition[edge.to]) {
            // Counted from both endpoints, halved below.
            internal[partition[edge.from]] += 2.0;
        }
    }
    for (size_t i = 0; i < nodeCount; ++i) {
        total[partition[i]] += degree[i];
    }

    double q = 0.0;
    for (const auto& [community, tot] : total) {
        auto it = internal.find(community);
        const double in = it != internal.end() ? it->second / 2.0 : 0.0;
        const double share = tot / (2.0 * m);
        q += in / m - share * share;
    }
    return q;
}

}  // namespace nodeweave
