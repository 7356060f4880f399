//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file transform/AnalysisIDs.hpp
/// @brief Named constants for the analysis identifiers known to
///        @ref strata::transform::AnalysisManager.
///
/// @details Results are registered and retrieved by string key. Spelling each
///          key once here turns a typo at a call site into a compile error.
///
//===----------------------------------------------------------------------===//

#pragma once

namespace strata::transform
{

/// @brief Per-region dominator trees of an op.
/// @see strata::analysis::DominanceInfo
inline constexpr const char *kAnalysisDominance = "dominance";

/// @brief Natural loops of every region under an op.
/// @see strata::analysis::LoopForest
inline constexpr const char *kAnalysisLoops = "loops";

/// @brief Next-use liveness together with dead-code facts.
/// @see strata::analysis::dataflow::LivenessAnalysis
inline constexpr const char *kAnalysisLiveness = "liveness";

} // namespace strata::transform
