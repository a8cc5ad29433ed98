#pragma once

#include "nodeweave/core/Graph.h"
#include "nodeweave/core/Types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nodeweave {

/// Tuning parameters of the force-directed solver.
struct ForceOptions {
    float repulsion = 1.5f;          ///< Repulsion constant, scaled by k
    float attraction = 0.0015f;      ///< Spring strength; larger pulls harder
    float gravityRadius = 250.0f;    ///< Repulsion fades out past this distance
    float theta = 0.5f;              ///< Barnes-Hut opening angle
    size_t leafCapacity = 5;         ///< Points per quadtree leaf
    float layoutArea = 250000.0f;    ///< k = sqrt(layoutArea / nodeCount)
};

struct NodePosition {
    Point pos;
    Point vel;
    bool locked = false;  ///< Locked nodes exert and receive force but never move

    NodePosition() = default;
    NodePosition(Point p, Point v = {}, bool l = false) : pos(p), vel(v), locked(l) {}
};

struct ForceStepResult {
    float maxDisplacement = 0.0f;
    std::vector<NodePosition> positions;
};

/// One-step force-directed placement. The host owns the loop and decides
/// when to stop, usually with AnnealingSchedule.
class ForceLayout {
public:
    static constexpr float VELOCITY_DAMPING = 0.4f;
    static constexpr float FORCE_TO_VELOCITY = 0.01f;
    static constexpr float EDGE_GAP = 4.0f;
    static constexpr float ATTRACTION_SCALE = 111.0f;
    static constexpr float FADE_BAND = 0.2f;

    /// Advance all unlocked nodes by one damped, temperature-clamped step.
    /// positions must have graph.nodeCount() entries.
    /// @throws std::invalid_argument on a size mismatch
    static ForceStepResult layoutStep(const LayoutGraph& graph,
                                      const std::vector<NodePosition>& positions,
                                      const ForceOptions& options,
                                      float temperature);

    /// Repulsion of source on target including the gravity-radius fade.
    static Point repulsionForce(Point target, Point source, float mass,
                                float repulsionFactor, float gravityRadius);

    /// 1 - smootherstep(x), clamped to [0, 1].
    static float smoothInvert(float x);

    /// Uniformly scattered start positions inside a square of the given area.
    static std::vector<NodePosition> scatter(size_t nodeCount, float layoutArea, uint32_t seed);
};

/// Geometric cooling schedule for repeated layoutStep calls.
class AnnealingSchedule {
public:
    struct Options {
        float startTemperature = 100.0f;
        float cooling = 0.98f;
        float minTemperature = 0.5f;
        float convergedDisplacement = 0.8f;
        int maxSteps = 2000;
    };

    AnnealingSchedule() = default;
    explicit AnnealingSchedule(const Options& options);

    float temperature() const { return temperature_; }
    int steps() const { return steps_; }

    /// Record the displacement of the finished step and cool down.
    /// @return true while another step should run
    bool advance(float maxDisplacement);

    bool converged() const { return converged_; }
    void reset();

private:
    Options options_;
    float temperature_ = 100.0f;
    int steps_ = 0;
    bool converged_ = false;
};

}  // namespace nodeweave
