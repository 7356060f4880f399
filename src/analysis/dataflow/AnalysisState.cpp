//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/AnalysisState.cpp
// Purpose: Hashing, canonicalization and printing of lattice anchors.
// Key invariants: Equal canonical anchors hash equally.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/AnalysisState.hpp"

#include "ir/Context.hpp"

namespace strata::analysis::dataflow
{

std::size_t LatticeAnchorHash::operator()(const LatticeAnchor &anchor) const noexcept
{
    std::size_t h = anchor.index();
    if (const auto *point = std::get_if<ir::ProgramPoint>(&anchor))
        return h ^ (ir::ProgramPointHash{}(*point) << 2);
    if (const auto *value = std::get_if<ir::ValueId>(&anchor))
        return h ^ (std::hash<ir::ValueId>{}(*value) << 2);
    const auto &edge = std::get<CfgEdge>(anchor);
    return h ^ ((std::hash<ir::BlockId>{}(edge.from) * 31 + std::hash<ir::BlockId>{}(edge.to)) << 2);
}

LatticeAnchor canonicalAnchor(const ir::Context &ctx, const LatticeAnchor &anchor)
{
    if (const auto *point = std::get_if<ir::ProgramPoint>(&anchor))
        return point->canonicalize(ctx);
    return anchor;
}

std::string anchorToString(const LatticeAnchor &anchor)
{
    if (const auto *point = std::get_if<ir::ProgramPoint>(&anchor))
        return point->toString();
    if (const auto *value = std::get_if<ir::ValueId>(&anchor))
        return "%" + std::to_string(value->index);
    const auto &edge = std::get<CfgEdge>(anchor);
    return "^bb" + std::to_string(edge.from.index) + " -> ^bb" + std::to_string(edge.to.index);
}

} // namespace strata::analysis::dataflow
