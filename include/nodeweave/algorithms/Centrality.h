#pragma once

#include "nodeweave/core/Graph.h"

#include <string>
#include <vector>

namespace nodeweave {

enum class CentralityAlgorithm {
    Degree,
    Betweenness,
    Closeness,
    KCore,
    Eigenvector,
    PageRank
};

/// Outcome of a power iteration. values holds the last iterate even when
/// converged is false so callers can fall back to it.
struct IterativeResult {
    std::vector<float> values;
    int iterations = 0;
    bool converged = false;
};

struct PowerIterationOptions {
    int maxIterations = 100;
    float tolerance = 1e-6f;
    float damping = 0.85f;  ///< PageRank only
};

/// Node-importance measures over the edge list. Unless noted the edges are
/// treated as undirected.
class Centrality {
public:
    static std::vector<float> degree(size_t nodeCount, const std::vector<EdgeData>& edges);

    /// Brandes' algorithm, unnormalized, one BFS per source in parallel.
    static std::vector<float> betweenness(size_t nodeCount, const std::vector<EdgeData>& edges);

    /// reachable / sum of distances per node; 0 for isolated nodes.
    static std::vector<float> closeness(size_t nodeCount, const std::vector<EdgeData>& edges);

    /// Core number of each node (Batagelj-Zaversnik bin peeling).
    static std::vector<float> kCore(size_t nodeCount, const std::vector<EdgeData>& edges);

    static IterativeResult eigenvector(size_t nodeCount, const std::vector<EdgeData>& edges,
                                       const PowerIterationOptions& options = {});

    /// Directed; dangling nodes spread their rank over all nodes.
    static IterativeResult pageRank(size_t nodeCount, const std::vector<EdgeData>& edges,
                                    const PowerIterationOptions& options = {});

    /// Divide by the maximum when it is positive.
    static std::vector<float> normalize(std::vector<float> values);

    /// Run one algorithm on the visible edges and normalize the result.
    static std::vector<float> runAlgorithm(CentralityAlgorithm algorithm, const LayoutGraph& graph);

    static std::string algorithmName(CentralityAlgorithm algorithm);
};

}  // namespace nodeweave
