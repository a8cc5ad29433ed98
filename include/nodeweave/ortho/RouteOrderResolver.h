#pragma once

#include <cstddef>
#include <vector>

namespace nodeweave {

/**
 * @brief Precedence graph over routes that refuses cycles.
 *
 * addRouteOrder(greater, less) records that greater comes before less.
 * An order that would close a cycle is rejected and counted, so the graph
 * always stays acyclic and topologicalSort() can consume every route.
 */
class RouteOrderResolver {
public:
    explicit RouteOrderResolver(size_t routeCount);

    /// @return false (and counts a cycle) if less already reaches greater
    /// @throws std::out_of_range for an unknown route
    bool addRouteOrder(size_t greater, size_t less);

    /// Breadth-first reachability; a route always reaches itself.
    bool hasPath(size_t from, size_t to) const;

    /// Kahn's algorithm, greater routes first.
    /// @throws std::logic_error if routes remain unconsumed
    std::vector<size_t> topologicalSort() const;

    size_t detectedCycles() const { return detectedCycles_; }
    size_t routeCount() const { return successors_.size(); }

private:
    std::vector<std::vector<size_t>> successors_;
    size_t detectedCycles_ = 0;
};

}  // namespace nodeweave
