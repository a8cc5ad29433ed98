#pragma once

#include "nodeweave/community/Louvain.h"
#include "nodeweave/force/ForceLayout.h"
#include "nodeweave/layout/CircularLayout.h"
#include "nodeweave/layout/LinearLayout.h"
#include "nodeweave/ortho/OrthogonalRouter.h"

namespace nodeweave {

/// Tuning parameters of every engine algorithm in one place.
/// Hosts usually keep one of these and hand the relevant member to each call.
struct EngineConfig {
    ForceOptions force;
    AnnealingSchedule::Options annealing;
    LouvainOptions louvain;
    CircularOptions circular;
    LinearOptions linear;
    OrthoOptions ortho;
};

}  // namespace nodeweave
