#include "nodeweave/core/Graph.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace nodeweave {

LayoutGraph::LayoutGraph(size_t nodeCount, Size defaultSize) {
    nodes_.reserve(nodeCount);
    for (size_t i = 0; i < nodeCount; ++i) {
        addNode(defaultSize);
    }
}

NodeId LayoutGraph::addNode() {
    return addNode(NodeData{}.size);
}

NodeId LayoutGraph::addNode(Size size) {
    if (size.width < 0.0f || size.height < 0.0f) {
        throw std::invalid_argument("Negative node size");
    }
    NodeData data;
    data.id = static_cast<NodeId>(nodes_.size());
    data.size = size;
    nodes_.push_back(data);
    return data.id;
}

const NodeData& LayoutGraph::getNode(NodeId id) const {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    return nodes_[id];
}

void LayoutGraph::setNodeSize(NodeId id, Size size) {
    if (!hasNode(id)) {
        throw std::out_of_range("Invalid node ID: " + std::to_string(id));
    }
    if (size.width < 0.0f || size.height < 0.0f) {
        throw std::invalid_argument("Negative node size");
    }
    nodes_[id].size = size;
}

EdgeId LayoutGraph::addEdge(NodeId from, NodeId to, TagId tag, float curvature) {
    if (!hasNode(from) || !hasNode(to)) {
        throw std::invalid_argument("Edge endpoint out of range: " +
                                    std::to_string(from) + " -> " + std::to_string(to));
    }
    EdgeData edge(from, to, tag, curvature);
    edge.id = static_cast<EdgeId>(edges_.size());
    edges_.push_back(edge);
    return edge.id;
}

const EdgeData& LayoutGraph::getEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    return edges_[id];
}

std::optional<EdgeData> LayoutGraph::tryGetEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        return std::nullopt;
    }
    return edges_[id];
}

void LayoutGraph::setEdgeCurvature(EdgeId id, float curvature) {
    if (!hasEdge(id)) {
        throw std::out_of_range("Invalid edge ID: " + std::to_string(id));
    }
    edges_[id].curvature = curvature;
}

void LayoutGraph::hideTag(TagId tag) {
    auto it = std::lower_bound(hiddenTags_.begin(), hiddenTags_.end(), tag);
    if (it == hiddenTags_.end() || *it != tag) {
        hiddenTags_.insert(it, tag);
    }
}

void LayoutGraph::showTag(TagId tag) {
    auto it = std::lower_bound(hiddenTags_.begin(), hiddenTags_.end(), tag);
    if (it != hiddenTags_.end() && *it == tag) {
        hiddenTags_.erase(it);
    }
}

bool LayoutGraph::isTagHidden(TagId tag) const {
    return std::binary_search(hiddenTags_.begin(), hiddenTags_.end(), tag);
}

std::vector<EdgeData> LayoutGraph::visibleEdges() const {
    std::vector<EdgeData> result;
    result.reserve(edges_.size());
    for (const auto& edge : edges_) {
        if (isEdgeVisible(edge)) {
            result.push_back(edge);
        }
    }
    return result;
}

void LayoutGraph::clear() {
    nodes_.clear();
    edges_.clear();
    hiddenTags_.clear();
}

}  // namespace nodeweave
