//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: transform/SpillAnalysis.hpp
// Purpose: Declares the spill placement decisions consumed by transformSpills:
//          edges to split, spills to insert and reloads to insert.
// Key invariants: Ids are dense indices into the matching record vector. A
//                 value is "spilled" once any spill of it has been recorded.
//                 Split, spill and reload records are filled in with the
//                 blocks and ops they materialize as the transform runs.
// Ownership/Lifetime: Plain value type; it refers to IR entities by id only.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Context.hpp"
#include "ir/ProgramPoint.hpp"

#include <cstdint>
#include <set>
#include <variant>
#include <vector>

namespace strata::transform
{

/// @brief Index of a SplitInfo within its SpillAnalysis.
struct SplitId
{
    uint32_t index = 0;

    friend bool operator==(const SplitId &, const SplitId &) = default;
};

/// @brief CFG edge taken by successor @c successor of terminator @c predecessor.
struct LocalEdge
{
    ir::BlockId from;
    ir::BlockId to;
    ir::OpId predecessor;
    uint32_t successor = 0;

    friend bool operator==(const LocalEdge &, const LocalEdge &) = default;
};

/// @brief Region control-flow edge of @c op; an invalid region is the parent op.
struct RegionalEdge
{
    ir::OpId op;
    ir::RegionId from;
    ir::RegionId to;

    friend bool operator==(const RegionalEdge &, const RegionalEdge &) = default;
};

using SplitEdge = std::variant<LocalEdge, RegionalEdge>;

/// @brief Control-flow edge that needs a dedicated block to host spill code.
struct SplitInfo
{
    SplitId id;
    SplitEdge edge;
    ir::BlockId split; ///< Block created for the edge; invalid until materialized.
};

/// @brief Where a spill or reload goes: an explicit point, or before the
///        terminator of a split block.
using Placement = std::variant<ir::ProgramPoint, SplitId>;

struct SpillInfo
{
    uint32_t id = 0;
    Placement placement;
    ir::ValueId value;
    support::SourceLoc loc;
    ir::OpId op; ///< Materialized spill; invalid until inserted.
};

struct ReloadInfo
{
    uint32_t id = 0;
    Placement placement;
    ir::ValueId value; ///< Spilled value being reloaded.
    support::SourceLoc loc;
    ir::OpId op; ///< Materialized reload; invalid until inserted.
};

/// @brief Spill placement for one callable, as decided by a register pressure analysis.
class SpillAnalysis
{
  public:
    /// @brief Record that @p edge must be split, reusing an existing record for the same edge.
    SplitId addSplit(const SplitEdge &edge);

    /// @brief Record that the edge taken by successor @p successor of @p terminator must be split.
    SplitId addSplit(const ir::Context &ctx, ir::OpId terminator, uint32_t successor);

    uint32_t addSpill(const Placement &placement, ir::ValueId value, support::SourceLoc loc = {});
    uint32_t addReload(const Placement &placement, ir::ValueId value, support::SourceLoc loc = {});

    const std::vector<SplitInfo> &splits() const
    {
        return splits_;
    }

    std::vector<SplitInfo> &splits()
    {
        return splits_;
    }

    const SplitInfo &split(SplitId id) const
    {
        return splits_[id.index];
    }

    const std::vector<SpillInfo> &spills() const
    {
        return spills_;
    }

    std::vector<SpillInfo> &spills()
    {
        return spills_;
    }

    const std::vector<ReloadInfo> &reloads() const
    {
        return reloads_;
    }

    std::vector<ReloadInfo> &reloads()
    {
        return reloads_;
    }

    /// @brief Values with at least one recorded spill, in id order.
    const std::set<ir::ValueId> &spilled() const
    {
        return spilled_;
    }

    bool isSpilled(ir::ValueId value) const
    {
        return spilled_.count(value) != 0;
    }

    bool isReloaded(ir::ValueId value) const;

    /// @brief True when a spill of @p value is placed exactly at @p placement.
    bool isSpilledAt(ir::ValueId value, const Placement &placement) const;

    /// @brief True when a reload of @p value is placed exactly at @p placement.
    bool isReloadedAt(ir::ValueId value, const Placement &placement) const;

    bool empty() const
    {
        return splits_.empty() && spills_.empty() && reloads_.empty();
    }

  private:
    std::vector<SplitInfo> splits_;
    std::vector<SpillInfo> spills_;
    std::vector<ReloadInfo> reloads_;
    std::set<ir::ValueId> spilled_;
};

} // namespace strata::transform
