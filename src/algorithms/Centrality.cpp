#include "nodeweave/algorithms/Centrality.h"
#include "nodeweave/core/ParallelFor.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <cmath>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace nodeweave {

namespace {

using Adjacency = std::vector<std::vector<uint32_t>>;

Adjacency undirectedAdjacency(size_t nodeCount, const std::vector<EdgeData>& edges) {
    Adjacency adj(nodeCount);
    for (const auto& edge : edges) {
        if (edge.from >= nodeCount || edge.to >= nodeCount) {
            throw std::invalid_argument("Edge endpoint out of range");
        }
        adj[edge.from].push_back(edge.to);
        adj[edge.to].push_back(edge.from);
    }
    return adj;
}

// BFS hop distances from source, -1 for unreachable nodes.
std::vector<int> bfsDistances(const Adjacency& adj, uint32_t source) {
    std::vector<int> dist(adj.size(), -1);
    std::deque<uint32_t> queue;
    dist[source] = 0;
    queue.push_back(source);
    while (!queue.empty()) {
        const uint32_t v = queue.front();
        queue.pop_front();
        for (uint32_t w : adj[v]) {
            if (dist[w] < 0) {
                dist[w] = dist[v] + 1;
                queue.push_back(w);
            }
        }
    }
    return dist;
}

float l1Diff(const std::vector<float>& a, const std::vector<float>& b) {
    float diff = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        diff += std::abs(a[i] - b[i]);
    }
    return diff;
}

}  // namespace

std::vector<float> Centrality::degree(size_t nodeCount, const std::vector<EdgeData>& edges) {
    std::vector<float> result(nodeCount, 0.0f);
    for (const auto& edge : edges) {
        if (edge.from >= nodeCount || edge.to >= nodeCount) {
            throw std::invalid_argument("Edge endpoint out of range");
        }
        result[edge.from] += 1.0f;
        result[edge.to] += 1.0f;
    }
    return result;
}

std::vector<float> Centrality::betweenness(size_t nodeCount, const std::vector<EdgeData>& edges) {
    const Adjacency adj = undirectedAdjacency(nodeCount, edges);
    std::vector<float> centrality(nodeCount, 0.0f);
    std::mutex mergeMutex;

    parallelForChunks(nodeCount, [&](size_t begin, size_t end) {
        std::vector<float> local(nodeCount, 0.0f);
        std::vector<int> dist(nodeCount);
        std::vector<uint32_t> sigma(nodeCount);
        std::vector<float> delta(nodeCount);
        std::vector<std::vector<uint32_t>> preds(nodeCount);
        std::vector<uint32_t> stack;
        std::deque<uint32_t> queue;

        for (size_t s = begin; s < end; ++s) {
            std::fill(dist.begin(), dist.end(), -1);
            std::fill(sigma.begin(), sigma.end(), 0u);
            std::fill(delta.begin(), delta.end(), 0.0f);
            for (auto& p : preds) {
                p.clear();
            }
            stack.clear();

            dist[s] = 0;
            sigma[s] = 1;
            queue.push_back(static_cast<uint32_t>(s));
            while (!queue.empty()) {
                const uint32_t v = queue.front();
                queue.pop_front();
                stack.push_back(v);
                for (uint32_t w : adj[v]) {
                    if (dist[w] < 0) {
                        dist[w] = dist[v] + 1;
                        queue.push_back(w);
                    }
                    if (dist[w] == dist[v] + 1) {
                        sigma[w] += sigma[v];
                        preds[w].push_back(v);
                    }
                }
            }

            while (!stack.empty()) {
                const uint32_t w = stack.back();
                stack.pop_back();
                for (uint32_t v : preds[w]) {
                    delta[v] += (static_cast<float>(sigma[v]) / static_cast<float>(sigma[w])) *
                                (1.0f + delta[w]);
                }
                if (w != s) {
                    local[w] += delta[w];
                }
            }
        }

        std::lock_guard<std::mutex> lock(mergeMutex);
        for (size_t i = 0; i < nodeCount; ++i) {
            centrality[i] += local[i];
        }
    }, 16);

    return centrality;
}

std::vector<float> Centrality::closeness(size_t nodeCount, const std::vector<EdgeData>& edges) {
    const Adjacency adj = undirectedAdjacency(nodeCount, edges);
    std::vector<float> result(nodeCount, 0.0f);

    parallelFor(nodeCount, [&](size_t i) {
        const std::vector<int> dist = bfsDistances(adj, static_cast<uint32_t>(i));
        long sum = 0;
        int reachable = 0;
        for (size_t j = 0; j < nodeCount; ++j) {
            if (j != i && dist[j] > 0) {
                sum += dist[j];
                ++reachable;
            }
        }
        result[i] = sum > 0 ? static_cast<float>(reachable) / static_cast<float>(sum) : 0.0f;
    }, 16);

    return result;
}

std::vector<float> Centrality::kCore(size_t nodeCount, const std::vector<EdgeData>& edges) {
    const Adjacency adj = undirectedAdjacency(nodeCount, edges);
    if (nodeCount == 0) {
        return {};
    }

    std::vector<size_t> deg(nodeCount);
    size_t maxDeg = 0;
    for (size_t v = 0; v < nodeCount; ++v) {
        deg[v] = adj[v].size();
        maxDeg = std::max(maxDeg, deg[v]);
    }

    // start[d]: first slot of degree-d nodes in vert
    std::vector<size_t> bin(maxDeg + 1, 0);
    for (size_t d : deg) {
        ++bin[d];
    }
    std::vector<size_t> start(maxDeg + 1, 0);
    size_t sum = 0;
    for (size_t d = 0; d <= maxDeg; ++d) {
        start[d] = sum;
        sum += bin[d];
    }

    std::vector<size_t> vert(nodeCount);
    std::vector<size_t> pos(nodeCount);
    std::vector<size_t> next = start;
    for (size_t v = 0; v < nodeCount; ++v) {
        pos[v] = next[deg[v]]++;
        vert[pos[v]] = v;
    }

    std::vector<float> core(nodeCount, 0.0f);
    for (size_t i = 0; i < nodeCount; ++i) {
        const size_t v = vert[i];
        core[v] = static_cast<float>(deg[v]);
        for (uint32_t u : adj[v]) {
            if (deg[u] > deg[v]) {
                const size_t du = deg[u];
                const size_t pu = pos[u];
                const size_t pw = start[du];
                const size_t w = vert[pw];
                if (u != w) {
                    vert[pu] = w;
                    pos[w] = pu;
                    vert[pw] = u;
                    pos[u] = pw;
                }
                ++start[du];
                --deg[u];
            }
        }
    }
    return core;
}

IterativeResult Centrality::eigenvector(size_t nodeCount, const std::vector<EdgeData>& edges,
                                        const PowerIterationOptions& options) {
    IterativeResult result;
    if (nodeCount == 0) {
        result.converged = true;
        return result;
    }
    const Adjacency adj = undirectedAdjacency(nodeCount, edges);

    std::vector<float> current(nodeCount, 1.0f);
    std::vector<float> next(nodeCount, 0.0f);
    for (int iter = 0; iter < options.maxIterations; ++iter) {
        for (size_t i = 0; i < nodeCount; ++i) {
            float sum = 0.0f;
            for (uint32_t nbr : adj[i]) {
                sum += current[nbr];
            }
            next[i] = sum;
        }

        float norm = 0.0f;
        for (float v : next) {
            norm += v * v;
        }
        norm = std::sqrt(norm);
        if (norm > 0.0f) {
            for (float& v : next) {
                v /= norm;
            }
        }

        const float diff = l1Diff(current, next);
        current.swap(next);
        result.iterations = iter + 1;
        if (diff < options.tolerance) {
            result.converged = true;
            break;
        }
    }

    result.values = std::move(current);
    return result;
}

IterativeResult Centrality::pageRank(size_t nodeCount, const std::vector<EdgeData>& edges,
                                     const PowerIterationOptions& options) {
    IterativeResult result;
    if (nodeCount == 0) {
        result.converged = true;
        return result;
    }

    Adjacency out(nodeCount);
    for (const auto& edge : edges) {
        if (edge.from >= nodeCount || edge.to >= nodeCount) {
            throw std::invalid_argument("Edge endpoint out of range");
        }
        out[edge.from].push_back(edge.to);
    }

    const float n = static_cast<float>(nodeCount);
    const float d = options.damping;
    std::vector<float> rank(nodeCount, 1.0f / n);
    std::vector<float> next(nodeCount);

    for (int iter = 0; iter < options.maxIterations; ++iter) {
        // Dangling mass is spread evenly, folded into the teleport term.
        float dangling = 0.0f;
        for (size_t i = 0; i < nodeCount; ++i) {
            if (out[i].empty()) {
                dangling += rank[i];
            }
        }
        std::fill(next.begin(), next.end(), (1.0f - d) / n + d * dangling / n);
        for (size_t i = 0; i < nodeCount; ++i) {
            if (out[i].empty()) {
                continue;
            }
            const float share = d * rank[i] / static_cast<float>(out[i].size());
            for (uint32_t nbr : out[i]) {
                next[nbr] += share;
            }
        }

        const float diff = l1Diff(rank, next);
        rank.swap(next);
        result.iterations = iter + 1;
        if (diff < options.tolerance) {
            result.converged = true;
            break;
        }
    }

    result.values = std::move(rank);
    return result;
}

std::vector<float> Centrality::normalize(std::vector<float> values) {
    if (values.empty()) {
        return values;
    }
    const float maxVal = *std::max_element(values.begin(), values.end());
    if (maxVal > 0.0f) {
        for (float& v : values) {
            v /= maxVal;
        }
    }
    return values;
}

std::vector<float> Centrality::runAlgorithm(CentralityAlgorithm algorithm, const LayoutGraph& graph) {
    const size_t n = graph.nodeCount();
    const std::vector<EdgeData> edges = graph.visibleEdges();

    switch (algorithm) {
        case CentralityAlgorithm::Degree:
            return normalize(degree(n, edges));
        case CentralityAlgorithm::Betweenness:
            return normalize(betweenness(n, edges));
        case CentralityAlgorithm::Closeness:
            return normalize(closeness(n, edges));
        case CentralityAlgorithm::KCore:
            return normalize(kCore(n, edges));
        case CentralityAlgorithm::Eigenvector:
        case CentralityAlgorithm::PageRank: {
            IterativeResult iterative = algorithm == CentralityAlgorithm::Eigenvector
                                            ? eigenvector(n, edges)
                                            : pageRank(n, edges);
            if (!iterative.converged) {
                LOG_WARN("{} did not converge after {} iterations, using last iterate",
                         algorithmName(algorithm), iterative.iterations);
            }
            return normalize(std::move(iterative.values));
        }
    }
    return std::vector<float>(n, 0.0f);
}

std::string Centrality::algorithmName(CentralityAlgorithm algorithm) {
    switch (algorithm) {
        case CentralityAlgorithm::Degree: return "Degree Centrality";
        case CentralityAlgorithm::Betweenness: return "Betweenness Centrality";
        case CentralityAlgorithm::Closeness: return "Closeness Centrality";
        case CentralityAlgorithm::KCore: return "K-Core Centrality";
        case CentralityAlgorithm::Eigenvector: return "Eigenvector Centrality";
        case CentralityAlgorithm::PageRank: return "Page Rank";
    }
    return "Unknown";
}

}  // namespace nodeweave
