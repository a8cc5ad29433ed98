#include "nodeweave/layout/OrderingUtils.h"

#include <algorithm>
#include <limits>
#include <numeric>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace nodeweave {

namespace {

size_t findRoot(std::vector<size_t>& parent, size_t x) {
    while (parent[x] != x) {
        parent[x] = parent[parent[x]];
        x = parent[x];
    }
    return x;
}

}  // namespace

std::vector<std::vector<NodeId>> OrderingUtils::findComponents(const std::vector<OrderEdge>& edges,
                                                               const std::vector<NodeId>& nodes) {
    std::unordered_map<NodeId, size_t> index;
    for (size_t i = 0; i < nodes.size(); ++i) {
        index.emplace(nodes[i], i);
    }

    std::vector<size_t> parent(nodes.size());
    std::iota(parent.begin(), parent.end(), size_t{0});
    for (const auto& edge : edges) {
        auto from = index.find(edge.from);
        auto to = index.find(edge.to);
        if (from == index.end() || to == index.end()) {
            continue;
        }
        const size_t a = findRoot(parent, from->second);
        const size_t b = findRoot(parent, to->second);
        if (a != b) {
            parent[std::max(a, b)] = std::min(a, b);
        }
    }

    std::vector<std::vector<NodeId>> components;
    std::unordered_map<size_t, size_t> componentOfRoot;
    for (size_t i = 0; i < nodes.size(); ++i) {
        const size_t root = findRoot(parent, i);
        auto [it, inserted] = componentOfRoot.emplace(root, components.size());
        if (inserted) {
            components.emplace_back();
        }
        components[it->second].push_back(nodes[i]);
    }
    return components;
}

AdjacencyMap OrderingUtils::buildAdjacency(const std::vector<OrderEdge>& edges) {
    AdjacencyMap adjacency;
    for (const auto& edge : edges) {
        adjacency[edge.from].push_back(edge.to);
        adjacency[edge.to].push_back(edge.from);
    }
    return adjacency;
}

NodeId OrderingUtils::leastConnectedNode(const AdjacencyMap& adjacency) {
    if (adjacency.empty()) {
        throw std::invalid_argument("leastConnectedNode: empty adjacency");
    }
    NodeId best = adjacency.begin()->first;
    size_t fewest = std::numeric_limits<size_t>::max();
    for (const auto& [node, neighbors] : adjacency) {
        if (neighbors.size() < fewest) {
            best = node;
            fewest = neighbors.size();
            if (fewest == 1) {
                break;
            }
        }
    }
    return best;
}

std::vector<NodeId> OrderingUtils::randomDfs(const AdjacencyMap& adjacency, NodeId start,
                                             std::mt19937& rng) {
    std::set<NodeId> visited;
    std::vector<NodeId> stack{start};
    std::vector<NodeId> order;

    while (!stack.empty()) {
        const NodeId node = stack.back();
        stack.pop_back();
        if (!visited.insert(node).second) {
            continue;
        }
        order.push_back(node);
        auto it = adjacency.find(node);
        if (it == adjacency.end()) {
            continue;
        }
        std::vector<NodeId> shuffled = it->second;
        std::shuffle(shuffled.begin(), shuffled.end(), rng);
        for (NodeId next : shuffled) {
            if (!visited.count(next)) {
                stack.push_back(next);
            }
        }
    }
    return order;
}

std::vector<NodeId> OrderingUtils::validSelection(const LayoutGraph& graph,
                                                  const std::vector<NodeId>& selection) {
    std::vector<NodeId> result;
    result.reserve(selection.size());
    for (NodeId id : selection) {
        if (graph.hasNode(id)) {
            result.push_back(id);
        }
    }
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<OrderEdge> OrderingUtils::edgesWithin(const LayoutGraph& graph,
                                                  const std::vector<NodeId>& sortedNodes) {
    auto contains = [&sortedNodes](NodeId id) {
        return std::binary_search(sortedNodes.begin(), sortedNodes.end(), id);
    };
    std::vector<OrderEdge> result;
    for (const auto& edge : graph.edges()) {
        if (graph.isEdgeVisible(edge) && contains(edge.from) && contains(edge.to)) {
            result.push_back({edge.from, edge.to});
        }
    }
    return result;
}

Rect OrderingUtils::boundsOf(const std::vector<NodePosition>& positions,
                             const std::vector<NodeId>& nodes) {
    Rect bounds = Rect::nothing();
    for (NodeId id : nodes) {
        bounds.extend(positions.at(id).pos);
    }
    return bounds;
}

}  // namespace nodeweave
