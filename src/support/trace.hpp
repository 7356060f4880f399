//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/trace.hpp
// Purpose: Declares environment-gated tracing used by analyses and transforms.
// Key invariants: STRATA_TRACE is read once per process; disabled topics write
//                 to a null stream.
// Ownership/Lifetime: Streams are process-wide singletons.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string_view>

namespace strata::support
{

/// @brief Subsystems that can be traced individually.
enum class TraceTopic
{
    DomTree,
    Dataflow,
    DeadCode,
    Liveness,
    Spills,
};

/// @brief Name used for @p topic in the STRATA_TRACE variable.
std::string_view traceTopicName(TraceTopic topic);

/// @brief Report whether tracing is enabled for @p topic.
/// @details STRATA_TRACE holds a comma-separated list of topic names, or "all".
bool traceEnabled(TraceTopic topic);

/// @brief Stream receiving trace output for @p topic.
/// @return std::cerr prefixed with the topic when enabled, otherwise a sink.
std::ostream &trace(TraceTopic topic);

} // namespace strata::support
