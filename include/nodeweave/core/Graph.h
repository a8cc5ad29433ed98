#pragma once

#include "Types.h"

#include <optional>
#include <vector>

namespace nodeweave {

struct NodeData {
    NodeId id = INVALID_NODE;
    Size size = {40.0f, 20.0f};
};

/// Layout-facing edge. Direction is kept for routing and ranking but the
/// force solver treats it as an undirected spring.
struct EdgeData {
    EdgeId id = INVALID_EDGE;
    NodeId from = INVALID_NODE;
    NodeId to = INVALID_NODE;
    TagId tag = 0;
    float curvature = 0.0f;  ///< Bend offset hint, written by LinearLayout

    EdgeData() = default;
    EdgeData(NodeId f, NodeId t, TagId tg = 0, float c = 0.0f)
        : from(f), to(t), tag(tg), curvature(c) {}

    bool isSelfLoop() const { return from == to; }
};

/// Snapshot of the graph handed to the engine by the host: dense node
/// indices, an ordered edge list and a set of hidden edge tags.
class LayoutGraph {
public:
    LayoutGraph() = default;
    explicit LayoutGraph(size_t nodeCount, Size defaultSize = NodeData{}.size);

    // Node operations
    NodeId addNode();
    NodeId addNode(Size size);
    bool hasNode(NodeId id) const { return id < nodes_.size(); }

    // Throws std::out_of_range for unknown ids.
    const NodeData& getNode(NodeId id) const;
    void setNodeSize(NodeId id, Size size);
    Size nodeSize(NodeId id) const { return getNode(id).size; }

    // Edge operations. Throws std::invalid_argument when an endpoint is unknown.
    EdgeId addEdge(NodeId from, NodeId to, TagId tag = 0, float curvature = 0.0f);
    bool hasEdge(EdgeId id) const { return id < edges_.size(); }

    // - getEdge(): throws std::out_of_range if the id is invalid.
    // - tryGetEdge(): returns std::nullopt instead.
    const EdgeData& getEdge(EdgeId id) const;
    std::optional<EdgeData> tryGetEdge(EdgeId id) const;
    void setEdgeCurvature(EdgeId id, float curvature);

    // Tag filter
    void hideTag(TagId tag);
    void showTag(TagId tag);
    bool isTagHidden(TagId tag) const;
    const std::vector<TagId>& hiddenTags() const { return hiddenTags_; }

    /// True when the edge takes part in force, community and routing work.
    bool isEdgeVisible(const EdgeData& edge) const { return !isTagHidden(edge.tag); }

    /// Edges whose tag is not hidden, in insertion order.
    std::vector<EdgeData> visibleEdges() const;

    // Queries
    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }
    const std::vector<NodeData>& nodes() const { return nodes_; }
    const std::vector<EdgeData>& edges() const { return edges_; }

    void clear();

private:
    std::vector<NodeData> nodes_;
    std::vector<EdgeData> edges_;
    std::vector<TagId> hiddenTags_;  // kept sorted
};

}  // namespace nodeweave
