#pragma once

#include "nodeweave/core/Types.h"

#include <algorithm>
#include <cstddef>
#include <vector>

namespace nodeweave {

struct WeightedPoint {
    Point pos;
    float mass = 1.0f;

    constexpr WeightedPoint() = default;
    constexpr WeightedPoint(Point p, float m) : pos(p), mass(m) {}
};

/**
 * @brief Flat quadtree for Barnes-Hut force approximation
 *
 * Rebuilt from scratch every solver step. Nodes live in one array; an
 * internal node stores the index of its first child (the four children are
 * contiguous) and every node stores the index to continue with when its
 * subtree is skipped, so accumulate() walks the tree depth-first without a
 * stack. Index 0 is the root, so a child index of 0 marks a leaf and a skip
 * index of 0 ends the walk.
 */
class BarnesHutTree {
public:
    static constexpr float DEFAULT_THETA = 0.5f;
    static constexpr size_t DEFAULT_LEAF_CAPACITY = 5;
    /// Subdivision stops at this depth so coincident points end up in one leaf.
    static constexpr int MAX_DEPTH = 24;

    explicit BarnesHutTree(float theta = DEFAULT_THETA);

    /// Clear and rebuild from points. Points with non-finite coordinates or
    /// mass are dropped (logged as a warning).
    void build(std::vector<WeightedPoint> points, size_t leafCapacity = DEFAULT_LEAF_CAPACITY);

    /// Sum forceFn(target, source) over all points, treating a subtree as
    /// its center of mass when size^2 < theta^2 * distance^2.
    template <typename ForceFn>
    Point accumulate(Point target, ForceFn&& forceFn) const;

    float theta() const { return theta_; }
    size_t pointCount() const { return items_.size(); }
    size_t nodeCount() const { return nodes_.size(); }
    bool empty() const { return items_.empty(); }
    const std::vector<WeightedPoint>& points() const { return items_; }

    /// Aggregated center of mass of the whole tree.
    WeightedPoint rootMass() const;

private:
    struct Node {
        Rect bound;
        size_t children = 0;
        size_t next = 0;
        WeightedPoint cm{Point{}, 0.0f};
        size_t begin = 0;
        size_t end = 0;
        int depth = 0;

        size_t itemCount() const { return end - begin; }
    };

    void subdivide(size_t n);
    static Rect boundOf(const std::vector<WeightedPoint>& items);

    std::vector<Node> nodes_;
    std::vector<size_t> internalNodes_;
    std::vector<WeightedPoint> items_;
    float theta_;
    float theta2_;
};

template <typename ForceFn>
Point BarnesHutTree::accumulate(Point target, ForceFn&& forceFn) const {
    Point acc;
    if (items_.empty()) {
        return acc;
    }

    size_t n = 0;
    do {
        const Node& node = nodes_[n];
        const float d2 = (target - node.cm.pos).lengthSquared();
        const float s = std::max(node.bound.width(), node.bound.height());
        if (s * s < theta2_ * d2) {
            acc += forceFn(target, node.cm);
            n = node.next;
        } else if (node.children == 0) {
            for (size_t i = node.begin; i < node.end; ++i) {
                acc += forceFn(target, items_[i]);
            }
            n = node.next;
        } else {
            n = node.children;
        }
    } while (n != 0);

    return acc;
}

}  // namespace nodeweave
