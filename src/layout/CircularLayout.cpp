#include "nodeweave/layout/CircularLayout.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace nodeweave {

namespace {

struct Interval {
    size_t start;
    size_t end;
};

std::vector<Interval> chordIntervals(const std::vector<NodeId>& order,
                                     const std::vector<OrderEdge>& edges,
                                     double& distanceSum) {
    std::unordered_map<NodeId, size_t> indexOf;
    for (size_t i = 0; i < order.size(); ++i) {
        indexOf.emplace(order[i], i);
    }

    const size_t n = order.size();
    std::vector<Interval> intervals;
    intervals.reserve(edges.size());
    distanceSum = 0.0;
    for (const auto& edge : edges) {
        auto from = indexOf.find(edge.from);
        auto to = indexOf.find(edge.to);
        if (from == indexOf.end() || to == indexOf.end()) {
            throw std::invalid_argument("Edge endpoint not present in order");
        }
        const size_t a = std::min(from->second, to->second);
        const size_t b = std::max(from->second, to->second);
        distanceSum += static_cast<double>(std::min(b - a, n - (b - a)));
        intervals.push_back({a, b});
    }
    return intervals;
}

struct Individual {
    std::vector<NodeId> order;
    double fitness = 0.0;
};

size_t tournament(const std::vector<Individual>& population, int size, std::mt19937& rng) {
    std::vector<size_t> all(population.size());
    for (size_t i = 0; i < all.size(); ++i) {
        all[i] = i;
    }
    std::vector<size_t> picked;
    const size_t k = std::min(static_cast<size_t>(std::max(size, 1)), all.size());
    std::sample(all.begin(), all.end(), std::back_inserter(picked), k, rng);

    size_t best = picked.front();
    for (size_t idx : picked) {
        if (population[idx].fitness < population[best].fitness) {
            best = idx;
        }
    }
    return best;
}

void mutate(std::vector<NodeId>& order, double rate, std::mt19937& rng) {
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    std::uniform_int_distribution<size_t> pick(0, order.size() - 1);
    for (size_t i = 0; i < order.size(); ++i) {
        if (chance(rng) < rate) {
            std::swap(order[i], order[pick(rng)]);
        }
    }
}

}  // namespace

std::vector<Point> CircularLayout::circlePositions(Point center, float radius, size_t count) {
    std::vector<Point> result;
    result.reserve(count);
    const double step = 2.0 * std::numbers::pi / static_cast<double>(std::max<size_t>(count, 1));
    for (size_t i = 0; i < count; ++i) {
        const double angle = step * static_cast<double>(i) - std::numbers::pi / 2.0;
        result.emplace_back(center.x + radius * static_cast<float>(std::cos(angle)),
                            center.y + radius * static_cast<float>(std::sin(angle)));
    }
    return result;
}

double CircularLayout::circularCost(const std::vector<NodeId>& order,
                                    const std::vector<OrderEdge>& edges) {
    double cost = 0.0;
    std::vector<Interval> intervals = chordIntervals(order, edges, cost);
    std::sort(intervals.begin(), intervals.end(),
              [](const Interval& l, const Interval& r) { return l.start < r.start; });

    // Sweep by start; an open chord crosses the new one when the new start
    // falls strictly inside it and the new end lies strictly beyond it.
    std::vector<Interval> open;
    for (const auto& interval : intervals) {
        for (const auto& active : open) {
            if (active.start < interval.start && interval.start < active.end &&
                active.end < interval.end) {
                cost += 1.0;
            }
        }
        open.push_back(interval);
        std::erase_if(open, [&interval](const Interval& i) { return i.end < interval.start; });
    }
    return cost;
}

double CircularLayout::circularCostPairwise(const std::vector<NodeId>& order,
                                            const std::vector<OrderEdge>& edges) {
    double cost = 0.0;
    const std::vector<Interval> intervals = chordIntervals(order, edges, cost);
    for (size_t i = 0; i < intervals.size(); ++i) {
        for (size_t j = i + 1; j < intervals.size(); ++j) {
            const auto [a, b] = intervals[i];
            const auto [c, d] = intervals[j];
            if ((a < c && c < b && b < d) || (c < a && a < d && d < b)) {
                cost += 1.0;
            }
        }
    }
    return cost;
}

std::vector<NodeId> CircularLayout::orderCrossover(const std::vector<NodeId>& first,
                                                   const std::vector<NodeId>& second,
                                                   size_t a, size_t b) {
    if (first.size() != second.size() || a > b || b > first.size()) {
        throw std::invalid_argument("orderCrossover: bad parents or cut points");
    }
    std::vector<NodeId> child(first.size());
    std::unordered_set<NodeId> kept(first.begin() + static_cast<std::ptrdiff_t>(a),
                                    first.begin() + static_cast<std::ptrdiff_t>(b));
    std::copy(first.begin() + static_cast<std::ptrdiff_t>(a),
              first.begin() + static_cast<std::ptrdiff_t>(b),
              child.begin() + static_cast<std::ptrdiff_t>(a));

    size_t slot = 0;
    for (NodeId node : second) {
        if (kept.count(node)) {
            continue;
        }
        if (slot == a) {
            slot = b;
        }
        child[slot++] = node;
    }
    return child;
}

std::vector<NodeId> CircularLayout::geneticOrder(const std::vector<OrderEdge>& edges,
                                                 const GeneticOptions& options,
                                                 std::mt19937& rng) {
    const AdjacencyMap adjacency = OrderingUtils::buildAdjacency(edges);
    if (adjacency.empty()) {
        return {};
    }
    const size_t n = adjacency.size();
    const size_t populationSize = static_cast<size_t>(std::max(options.populationSize, 1));

    std::vector<Individual> population;
    population.reserve(populationSize);
    const NodeId start = OrderingUtils::leastConnectedNode(adjacency);
    for (size_t i = 0; i < populationSize; ++i) {
        std::vector<NodeId> order = OrderingUtils::randomDfs(adjacency, start, rng);
        // Disconnected input: continue the walk from each unvisited node.
        if (order.size() < n) {
            std::unordered_set<NodeId> seen(order.begin(), order.end());
            for (const auto& [node, neighbors] : adjacency) {
                if (seen.count(node)) {
                    continue;
                }
                for (NodeId visited : OrderingUtils::randomDfs(adjacency, node, rng)) {
                    if (seen.insert(visited).second) {
                        order.push_back(visited);
                    }
                }
            }
        }
        population.push_back({std::move(order), 0.0});
    }

    // Expected swaps per individual stay near mutationRate * 10.
    const double mutationRate = options.mutationRate * 10.0 / static_cast<double>(n);
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    std::uniform_int_distribution<size_t> cut(0, n - 1);

    std::vector<NodeId> bestOrder = population.front().order;
    double bestFitness = std::numeric_limits<double>::infinity();
    int stagnant = 0;

    for (int generation = 0; generation < options.generations; ++generation) {
        size_t generationBest = 0;
        for (size_t i = 0; i < population.size(); ++i) {
            population[i].fitness = circularCost(population[i].order, edges);
            if (population[i].fitness < population[generationBest].fitness) {
                generationBest = i;
            }
        }

        if (population[generationBest].fitness < bestFitness) {
            bestFitness = population[generationBest].fitness;
            bestOrder = population[generationBest].order;
            stagnant = 0;
        } else if (++stagnant >= options.maxStagnation) {
            LOG_DEBUG("Stopped after {} generations, cost {}", generation + 1, bestFitness);
            break;
        }

        std::vector<Individual> next;
        next.reserve(populationSize);
        while (next.size() < populationSize) {
            const auto& p1 = population[tournament(population, options.tournamentSize, rng)];
            const auto& p2 = population[tournament(population, options.tournamentSize, rng)];

            std::vector<NodeId> c1;
            std::vector<NodeId> c2;
            if (chance(rng) < options.crossoverRate) {
                const size_t i = cut(rng);
                const size_t j = cut(rng);
                const size_t a = std::min(i, j);
                const size_t b = std::max(i, j);
                c1 = orderCrossover(p1.order, p2.order, a, b);
                c2 = orderCrossover(p2.order, p1.order, a, b);
            } else {
                c1 = p1.order;
                c2 = p2.order;
            }
            mutate(c1, mutationRate, rng);
            mutate(c2, mutationRate, rng);
            next.push_back({std::move(c1), 0.0});
            if (next.size() < populationSize) {
                next.push_back({std::move(c2), 0.0});
            }
        }
        population = std::move(next);
    }

    return bestOrder;
}

void CircularLayout::apply(const LayoutGraph& graph,
                           std::vector<NodePosition>& positions,
                           const std::vector<NodeId>& selection,
                           const CircularOptions& options) {
    if (positions.size() != graph.nodeCount()) {
        throw std::invalid_argument("CircularLayout: positions.size() " +
                                    std::to_string(positions.size()) + " != node count " +
                                    std::to_string(graph.nodeCount()));
    }

    const std::vector<NodeId> nodes = OrderingUtils::validSelection(graph, selection);
    if (nodes.size() < 2) {
        return;
    }

    const std::vector<OrderEdge> edges = OrderingUtils::edgesWithin(graph, nodes);
    const Rect bounds = OrderingUtils::boundsOf(positions, nodes);
    const Point center = bounds.center();
    float radius = center.distanceTo(bounds.min);
    if (radius <= 0.0f) {
        radius = options.fallbackSpacing * static_cast<float>(nodes.size()) /
                 (2.0f * std::numbers::pi_v<float>);
        LOG_WARN("Selected nodes share one position, using radius {}", radius);
    }

    std::mt19937 rng(options.seed);
    const auto components = OrderingUtils::findComponents(edges, nodes);
    for (const auto& component : components) {
        if (component.size() <= 2) {
            continue;
        }
        std::vector<OrderEdge> componentEdges;
        const NodeId first = component.front();
        for (const auto& edge : edges) {
            // Components are disjoint, so one endpoint decides membership.
            if (std::find(component.begin(), component.end(), edge.from) != component.end()) {
                componentEdges.push_back(edge);
            }
        }

        const std::vector<NodeId> order = geneticOrder(componentEdges, options.genetic, rng);
        const std::vector<Point> circle = circlePositions(center, radius, order.size());
        for (size_t i = 0; i < order.size(); ++i) {
            positions[order[i]].pos = circle[i];
            positions[order[i]].vel = Point{};
        }
        LOG_DEBUG("Placed component of node {} ({} nodes) on circle r={}", first, order.size(), radius);
    }
}

}  // namespace nodeweave
