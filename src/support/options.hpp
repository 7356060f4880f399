//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/options.hpp
// Purpose: Declares the settings that tune analyses and the spill transform.
// Key invariants: None.
// Ownership/Lifetime: Caller owns option values.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace strata::support
{

/// @brief Settings shared by the dataflow analyses and dominance queries.
/// @ownership Value type.
struct AnalysisOptions
{
    /// @brief Distance added to next-use distances on edges leaving a loop.
    uint32_t loopExitDistance = 100000;

    /// @brief Slow dominance queries tolerated before DFS numbers are rebuilt.
    unsigned slowQueryThreshold = 32;

    /// @brief Propagate dataflow facts across call boundaries.
    /// @note Liveness does not support interprocedural propagation and treats
    ///       this flag as a fatal request.
    bool interprocedural = false;

    /// @brief Verify dominator trees after incremental updates performed by transforms.
    bool verifyDominance = false;
};

} // namespace strata::support
