#pragma once

#include "nodeweave/layout/OrderingUtils.h"

#include <cstdint>
#include <random>
#include <vector>

namespace nodeweave {

/**
 * @brief Parameters of the genetic search for a circular order.
 */
struct GeneticOptions {
    int populationSize = 50;
    int generations = 100;
    double crossoverRate = 0.5;
    double mutationRate = 0.01;
    int tournamentSize = 3;
    /// Stop after this many generations without improvement.
    int maxStagnation = 15;
};

struct CircularOptions {
    GeneticOptions genetic;
    uint32_t seed = 0;
    /// Radius used when all selected nodes share one position.
    float fallbackSpacing = 50.0f;
};

/**
 * @brief Places selected nodes on a circle, ordered to keep neighbors close
 *        and chords from crossing.
 *
 * Each connected component of the selection with more than two nodes is
 * ordered by a genetic algorithm minimizing circularCost(), then placed on
 * a circle around the centroid of the selection's bounding box. Smaller
 * components keep their positions.
 */
class CircularLayout {
public:
    /// Reposition selected nodes. No-op for fewer than two valid nodes.
    /// @throws std::invalid_argument if positions.size() != graph.nodeCount()
    static void apply(const LayoutGraph& graph,
                      std::vector<NodePosition>& positions,
                      const std::vector<NodeId>& selection,
                      const CircularOptions& options = {});

    /// n points evenly spaced starting at the top, clockwise in screen space.
    static std::vector<Point> circlePositions(Point center, float radius, size_t count);

    /// Sum of circular index distances plus the number of crossing chords.
    /// @throws std::invalid_argument if an edge endpoint is not in order
    static double circularCost(const std::vector<NodeId>& order, const std::vector<OrderEdge>& edges);

    /// O(e^2) reference for circularCost(); both must agree.
    static double circularCostPairwise(const std::vector<NodeId>& order,
                                       const std::vector<OrderEdge>& edges);

    /// Best order found by the genetic search over the nodes of edges.
    static std::vector<NodeId> geneticOrder(const std::vector<OrderEdge>& edges,
                                            const GeneticOptions& options,
                                            std::mt19937& rng);

    /// Order-preserving crossover: child keeps first[a, b), the rest in second's order.
    static std::vector<NodeId> orderCrossover(const std::vector<NodeId>& first,
                                              const std::vector<NodeId>& second,
                                              size_t a, size_t b);
};

}  // namespace nodeweave
