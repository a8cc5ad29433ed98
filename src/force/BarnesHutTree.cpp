#include "nodeweave/force/BarnesHutTree.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>

namespace nodeweave {

BarnesHutTree::BarnesHutTree(float theta)
    : theta_(theta), theta2_(theta * theta) {}

void BarnesHutTree::build(std::vector<WeightedPoint> points, size_t leafCapacity) {
    nodes_.clear();
    internalNodes_.clear();
    items_.clear();
    items_.reserve(points.size());

    size_t dropped = 0;
    for (const auto& p : points) {
        if (p.pos.isFinite() && std::isfinite(p.mass)) {
            items_.push_back(p);
        } else {
            ++dropped;
        }
    }
    if (dropped > 0) {
        LOG_WARN("Dropped {} non-finite points of {}", dropped, points.size());
    }
    if (items_.empty()) {
        return;
    }

    leafCapacity = std::max<size_t>(leafCapacity, 1);

    Node root;
    root.bound = boundOf(items_);
    root.begin = 0;
    root.end = items_.size();
    nodes_.push_back(root);

    // Breadth-first: children are appended behind the node being processed.
    for (size_t n = 0; n < nodes_.size(); ++n) {
        const Node& node = nodes_[n];
        const bool splittable = node.depth < MAX_DEPTH &&
                                (node.bound.width() > 0.0f || node.bound.height() > 0.0f);
        if (node.itemCount() > leafCapacity && splittable) {
            subdivide(n);
        } else {
            WeightedPoint cm{Point{}, 0.0f};
            for (size_t i = node.begin; i < node.end; ++i) {
                cm.pos += items_[i].pos * items_[i].mass;
                cm.mass += items_[i].mass;
            }
            nodes_[n].cm = cm;
        }
    }

    // Children always come after their parent, so reverse order sums bottom-up.
    for (auto it = internalNodes_.rbegin(); it != internalNodes_.rend(); ++it) {
        Node& node = nodes_[*it];
        for (size_t i = 0; i < 4; ++i) {
            const WeightedPoint& child = nodes_[node.children + i].cm;
            node.cm.pos += child.pos;
            node.cm.mass += child.mass;
        }
    }

    for (auto& node : nodes_) {
        node.cm.pos = node.cm.pos / std::max(node.cm.mass, std::numeric_limits<float>::min());
    }
}

WeightedPoint BarnesHutTree::rootMass() const {
    if (nodes_.empty()) {
        return {Point{}, 0.0f};
    }
    return nodes_.front().cm;
}

void BarnesHutTree::subdivide(size_t n) {
    const size_t c = nodes_.size();
    nodes_[n].children = c;
    internalNodes_.push_back(n);

    const Rect bound = nodes_[n].bound;
    const Point center = bound.center();
    const size_t begin = nodes_[n].begin;
    const size_t end = nodes_[n].end;

    auto above = [&center](const WeightedPoint& p) { return p.pos.y < center.y; };
    auto leftOf = [&center](const WeightedPoint& p) { return p.pos.x < center.x; };

    std::array<size_t, 5> split{};
    split[0] = begin;
    split[4] = end;
    split[2] = static_cast<size_t>(
        std::partition(items_.begin() + begin, items_.begin() + end, above) - items_.begin());
    split[1] = static_cast<size_t>(
        std::partition(items_.begin() + split[0], items_.begin() + split[2], leftOf) - items_.begin());
    split[3] = static_cast<size_t>(
        std::partition(items_.begin() + split[2], items_.begin() + split[4], leftOf) - items_.begin());

    const Point dx{center.x - bound.min.x, 0.0f};
    const Point dy{0.0f, center.y - bound.min.y};
    const std::array<Rect, 4> quarters = {
        Rect{bound.min, center},
        Rect{bound.min + dx, center + dx},
        Rect{bound.min + dy, center + dy},
        Rect{center, bound.max},
    };
    const std::array<size_t, 4> nexts = {c + 1, c + 2, c + 3, nodes_[n].next};
    const int depth = nodes_[n].depth + 1;

    for (size_t i = 0; i < 4; ++i) {
        Node child;
        child.bound = quarters[i];
        child.begin = split[i];
        child.end = split[i + 1];
        child.next = nexts[i];
        child.depth = depth;
        nodes_.push_back(child);
    }
}

Rect BarnesHutTree::boundOf(const std::vector<WeightedPoint>& items) {
    Rect bound = Rect::nothing();
    for (const auto& item : items) {
        bound.extend(item.pos);
    }
    return bound;
}

}  // namespace nodeweave
