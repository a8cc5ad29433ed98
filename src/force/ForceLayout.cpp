#include "nodeweave/force/ForceLayout.h"
#include "nodeweave/force/BarnesHutTree.h"
#include "nodeweave/core/ParallelFor.h"
#include "nodeweave/common/Logger.h"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>

namespace nodeweave {

float ForceLayout::smoothInvert(float x) {
    if (x <= 0.0f) {
        return 1.0f;
    }
    if (x >= 1.0f) {
        return 0.0f;
    }
    const float x3 = x * x * x;
    const float s = x3 * (x * (6.0f * x - 15.0f) + 10.0f);
    return 1.0f - s;
}

Point ForceLayout::repulsionForce(Point target, Point source, float mass,
                                  float repulsionFactor, float gravityRadius) {
    const Point dir = target - source;
    if (dir.x == 0.0f && dir.y == 0.0f) {
        return {};
    }
    const float dist = dir.length();
    float scale = 1.0f;
    if (dist > gravityRadius) {
        if (dist > gravityRadius * (1.0f + FADE_BAND)) {
            return {};
        }
        // Fade out across the band so nodes do not snap at the radius.
        scale = smoothInvert((dist - gravityRadius) / (gravityRadius * FADE_BAND));
    }
    const float magnitude = (mass * repulsionFactor) / dist;
    return (dir / dist) * (scale * magnitude);
}

ForceStepResult ForceLayout::layoutStep(const LayoutGraph& graph,
                                        const std::vector<NodePosition>& positions,
                                        const ForceOptions& options,
                                        float temperature) {
    ForceStepResult result;
    const size_t n = graph.nodeCount();
    if (n == 0) {
        return result;
    }
    if (positions.size() != n) {
        throw std::invalid_argument("layoutStep: " + std::to_string(positions.size()) +
                                    " positions for " + std::to_string(n) + " nodes");
    }

    std::vector<NodePosition> current = positions;
    size_t sanitized = 0;
    for (auto& p : current) {
        if (!p.pos.isFinite() || !p.vel.isFinite()) {
            p.pos = {};
            p.vel = {};
            ++sanitized;
        }
    }
    if (sanitized > 0) {
        LOG_WARN("Reset {} non-finite node positions", sanitized);
    }

    const float k = std::sqrt(options.layoutArea / static_cast<float>(n));
    const float repulsionFactor = (options.repulsion * k) * (options.repulsion * k);
    const float attraction = ATTRACTION_SCALE / options.attraction;
    const float radius = options.gravityRadius;

    std::vector<WeightedPoint> points;
    points.reserve(n);
    for (const auto& p : current) {
        points.emplace_back(p.pos, 1.0f);
    }
    BarnesHutTree tree(options.theta);
    tree.build(std::move(points), options.leafCapacity);

    std::vector<Point> forces(n);
    parallelFor(n, [&](size_t i) {
        forces[i] = tree.accumulate(current[i].pos, [&](Point target, const WeightedPoint& source) {
            return repulsionForce(target, source.pos, source.mass, repulsionFactor, radius);
        });
    });

    for (const auto& edge : graph.edges()) {
        if (edge.isSelfLoop() || !graph.isEdgeVisible(edge)) {
            continue;
        }
        const Point dir = current[edge.from].pos - current[edge.to].pos;
        const float distance = dir.length() - graph.nodeSize(edge.from).width / 2.0f -
                               graph.nodeSize(edge.to).width / 2.0f - EDGE_GAP;
        if (distance == 0.0f) {
            continue;
        }
        const float force = distance * distance / attraction;
        const Point fv = (dir / distance) * force;
        forces[edge.from] -= fv;
        forces[edge.to] += fv;
    }

    std::atomic<float> maxMove{0.0f};
    result.positions.resize(n);
    parallelFor(n, [&](size_t i) {
        const NodePosition& position = current[i];
        if (position.locked) {
            result.positions[i] = position;
            return;
        }
        Point v = position.vel * VELOCITY_DAMPING + forces[i] * FORCE_TO_VELOCITY;
        const float len = v.length();
        if (len > temperature) {
            v = (v / len) * temperature;
            atomicFetchMax(maxMove, temperature);
        } else {
            atomicFetchMax(maxMove, len);
        }
        result.positions[i] = NodePosition{position.pos + v, v, false};
    });

    result.maxDisplacement = maxMove.load();
    return result;
}

std::vector<NodePosition> ForceLayout::scatter(size_t nodeCount, float layoutArea, uint32_t seed) {
    std::mt19937 rng(seed);
    const float side = std::sqrt(std::max(layoutArea, 0.0f));
    std::uniform_real_distribution<float> dist(-side / 2.0f, side / 2.0f);

    std::vector<NodePosition> result;
    result.reserve(nodeCount);
    for (size_t i = 0; i < nodeCount; ++i) {
        const float x = dist(rng);
        const float y = dist(rng);
        result.emplace_back(Point{x, y});
    }
    return result;
}

// ===== AnnealingSchedule =====

AnnealingSchedule::AnnealingSchedule(const Options& options)
    : options_(options), temperature_(options.startTemperature) {}

bool AnnealingSchedule::advance(float maxDisplacement) {
    ++steps_;
    converged_ = maxDisplacement < options_.convergedDisplacement &&
                 temperature_ < options_.minTemperature;
    temperature_ *= options_.cooling;
    if (converged_) {
        LOG_DEBUG("Converged after {} steps (displacement {:.3f})", steps_, maxDisplacement);
        return false;
    }
    return steps_ < options_.maxSteps;
}

void AnnealingSchedule::reset() {
    temperature_ = options_.startTemperature;
    steps_ = 0;
    converged_ = false;
}

}  // namespace nodeweave
