#pragma once

/// @file nodeweave.h
/// @brief Main header for the nodeweave layout engine
///
/// nodeweave computes node placement, community structure and orthogonal
/// edge routes for node-link diagrams. The host owns the graph and the
/// animation loop; every call takes a snapshot and returns plain results.
///
/// Example usage:
/// @code
/// #include <nodeweave/nodeweave.h>
///
/// nodeweave::LayoutGraph graph(3);
/// graph.addEdge(0, 1);
/// graph.addEdge(1, 2);
///
/// auto positions = nodeweave::ForceLayout::scatter(graph.nodeCount(), 250000.0f, 42);
/// nodeweave::AnnealingSchedule schedule;
/// do {
///     auto step = nodeweave::ForceLayout::layoutStep(graph, positions, {}, schedule.temperature());
///     positions = std::move(step.positions);
///     if (!schedule.advance(step.maxDisplacement)) break;
/// } while (true);
///
/// auto routes = nodeweave::OrthogonalRouter::route(graph, positions);
/// @endcode

// Core module - Graph snapshot and geometry
#include "core/Types.h"
#include "core/Graph.h"

// Logging
#include "common/Logger.h"

// Placement
#include "force/BarnesHutTree.h"
#include "force/ForceLayout.h"
#include "layout/CircularLayout.h"
#include "layout/LinearLayout.h"

// Analysis
#include "community/Louvain.h"
#include "algorithms/Centrality.h"

// Orthogonal routing
#include "ortho/OrthogonalRouter.h"

// Configuration
#include "serialization/EngineConfig.h"
#include "serialization/EngineSerializer.h"

#include <string>

namespace nodeweave {

/// Library version
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

/// Get version as string (computed from constants)
inline std::string versionString() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

}  // namespace nodeweave
