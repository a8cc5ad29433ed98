#include "nodeweave/layout/LinearLayout.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <map>
#include <numeric>
#include <random>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace nodeweave {

float LinearLayout::edgeCurvature(size_t fromIndex, size_t toIndex, size_t duplicate,
                                  const LinearOptions& options) {
    const float gap = static_cast<float>(fromIndex > toIndex ? fromIndex - toIndex : toIndex - fromIndex);
    return options.spacing * (gap - 1.0f) + options.duplicateOffset * static_cast<float>(duplicate);
}

void LinearLayout::apply(LayoutGraph& graph,
                         std::vector<NodePosition>& positions,
                         const std::vector<NodeId>& selection,
                         const LinearOptions& options) {
    if (positions.size() != graph.nodeCount()) {
        throw std::invalid_argument("LinearLayout: positions.size() " +
                                    std::to_string(positions.size()) + " != node count " +
                                    std::to_string(graph.nodeCount()));
    }

    std::vector<NodeId> nodes;
    if (selection.size() < 3) {
        nodes.resize(graph.nodeCount());
        std::iota(nodes.begin(), nodes.end(), NodeId{0});
    } else {
        nodes = OrderingUtils::validSelection(graph, selection);
    }
    if (nodes.size() < 2) {
        return;
    }

    // Parallel edges share a key; their position in the list is the
    // duplicate index used for curvature.
    std::map<std::pair<NodeId, NodeId>, std::vector<EdgeId>> edgesByEnds;
    std::vector<OrderEdge> edges;
    for (const auto& edge : graph.edges()) {
        if (!graph.isEdgeVisible(edge) ||
            !std::binary_search(nodes.begin(), nodes.end(), edge.from) ||
            !std::binary_search(nodes.begin(), nodes.end(), edge.to)) {
            continue;
        }
        edgesByEnds[{edge.from, edge.to}].push_back(edge.id);
        edges.push_back({edge.from, edge.to});
    }

    const Rect bounds = OrderingUtils::boundsOf(positions, nodes);
    const Point center = bounds.center();
    const bool horizontal = options.orientation == LayoutOrientation::Horizontal;
    float cursor = horizontal ? bounds.left() : bounds.top();

    std::mt19937 rng(options.seed);
    std::vector<NodeId> order;
    order.reserve(nodes.size());

    for (const auto& component : OrderingUtils::findComponents(edges, nodes)) {
        if (component.size() <= 2) {
            order.insert(order.end(), component.begin(), component.end());
            continue;
        }

        const std::unordered_set<NodeId> members(component.begin(), component.end());
        std::vector<OrderEdge> componentEdges;
        for (const auto& edge : edges) {
            if (members.count(edge.from)) {
                componentEdges.push_back(edge);
            }
        }

        const AdjacencyMap adjacency = OrderingUtils::buildAdjacency(componentEdges);
        const std::vector<NodeId> walk =
            OrderingUtils::randomDfs(adjacency, OrderingUtils::leastConnectedNode(adjacency), rng);

        std::unordered_map<NodeId, size_t> slot;
        for (size_t i = 0; i < walk.size(); ++i) {
            slot.emplace(walk[i], i);
        }
        for (const auto& [ends, edgeIds] : edgesByEnds) {
            if (ends.first == ends.second || !members.count(ends.first)) {
                continue;
            }
            for (size_t k = 0; k < edgeIds.size(); ++k) {
                graph.setEdgeCurvature(edgeIds[k],
                                       edgeCurvature(slot.at(ends.first), slot.at(ends.second), k, options));
            }
        }
        order.insert(order.end(), walk.begin(), walk.end());
    }

    for (NodeId id : order) {
        const Size size = graph.nodeSize(id);
        NodePosition& position = positions[id];
        if (horizontal) {
            position.pos = Point{cursor + size.width * 0.5f, center.y};
            cursor += size.width + options.spacing;
        } else {
            position.pos = Point{center.x, cursor + size.height * 0.5f};
            cursor += size.height + options.spacing;
        }
        position.vel = Point{};
    }

    LOG_DEBUG("Placed {} nodes {}", order.size(), horizontal ? "horizontally" : "vertically");
}

}  // namespace nodeweave
