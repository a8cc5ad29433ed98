#include "nodeweave/ortho/RouteOrderResolver.h"
#include "nodeweave/common/Logger.h"

#include <deque>
#include <stdexcept>
#include <string>

namespace nodeweave {

RouteOrderResolver::RouteOrderResolver(size_t routeCount)
    : successors_(routeCount) {}

bool RouteOrderResolver::addRouteOrder(size_t greater, size_t less) {
    if (greater >= successors_.size() || less >= successors_.size()) {
        throw std::out_of_range("Route index out of range: " + std::to_string(greater) + ", " +
                                std::to_string(less));
    }
    if (hasPath(less, greater)) {
        ++detectedCycles_;
        LOG_TRACE("Rejected order {} over {}", greater, less);
        return false;
    }
    successors_[greater].push_back(less);
    return true;
}

bool RouteOrderResolver::hasPath(size_t from, size_t to) const {
    if (from == to) {
        return true;
    }
    std::vector<bool> visited(successors_.size(), false);
    std::deque<size_t> queue{from};
    while (!queue.empty()) {
        const size_t node = queue.front();
        queue.pop_front();
        if (visited[node]) {
            continue;
        }
        visited[node] = true;
        for (size_t next : successors_[node]) {
            if (next == to) {
                return true;
            }
            if (!visited[next]) {
                queue.push_back(next);
            }
        }
    }
    return false;
}

std::vector<size_t> RouteOrderResolver::topologicalSort() const {
    std::vector<size_t> inDegree(successors_.size(), 0);
    for (const auto& targets : successors_) {
        for (size_t t : targets) {
            ++inDegree[t];
        }
    }

    std::vector<size_t> ready;
    for (size_t i = 0; i < inDegree.size(); ++i) {
        if (inDegree[i] == 0) {
            ready.push_back(i);
        }
    }

    std::vector<size_t> sorted;
    sorted.reserve(successors_.size());
    while (!ready.empty()) {
        const size_t node = ready.back();
        ready.pop_back();
        sorted.push_back(node);
        for (size_t next : successors_[node]) {
            if (--inDegree[next] == 0) {
                ready.push_back(next);
            }
        }
    }

    if (sorted.size() != successors_.size()) {
        LOG_ERROR("Route order graph has a cycle: sorted {} of {}", sorted.size(), successors_.size());
        throw std::logic_error("Route order graph is not acyclic");
    }
    return sorted;
}

}  // namespace nodeweave
