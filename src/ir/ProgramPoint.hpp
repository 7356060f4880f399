//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/ProgramPoint.hpp
// Purpose: Names a position in the IR between two operations or at a block
//          boundary.
// Key invariants: Several spellings can denote the same position; the
//                 canonical form prefers "after op" and falls back to
//                 "start of block" when no operation precedes the point.
// Ownership/Lifetime: Plain value type holding ids into a Context.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Ids.hpp"

#include <cstddef>
#include <string>

namespace strata::ir
{

class Context;

/// @brief Position in a block, possibly relative to an operation.
struct ProgramPoint
{
    enum class Kind
    {
        BlockStart,
        BlockEnd,
        BeforeOp,
        AfterOp
    };

    Kind kind = Kind::BlockStart;
    BlockId block;
    OpId op;

    static ProgramPoint atStartOf(BlockId b)
    {
        return ProgramPoint{Kind::BlockStart, b, OpId()};
    }

    static ProgramPoint atEndOf(BlockId b)
    {
        return ProgramPoint{Kind::BlockEnd, b, OpId()};
    }

    /// @brief Point immediately before @p o; @p ctx supplies its block.
    static ProgramPoint before(const Context &ctx, OpId o);

    /// @brief Point immediately after @p o; @p ctx supplies its block.
    static ProgramPoint after(const Context &ctx, OpId o);

    bool isBlockStart() const
    {
        return kind == Kind::BlockStart;
    }

    bool isBlockEnd() const
    {
        return kind == Kind::BlockEnd;
    }

    bool isBefore() const
    {
        return kind == Kind::BeforeOp;
    }

    bool isAfter() const
    {
        return kind == Kind::AfterOp;
    }

    /// @brief Rewrite to the unique canonical spelling of the same position.
    ProgramPoint canonicalize(const Context &ctx) const;

    /// @brief Operation that executes right after this point, if any.
    OpId nextOp(const Context &ctx) const;

    /// @brief Operation that executed right before this point, if any.
    OpId prevOp(const Context &ctx) const;

    std::string toString() const;

    friend bool operator==(const ProgramPoint &, const ProgramPoint &) = default;
};

struct ProgramPointHash
{
    std::size_t operator()(const ProgramPoint &p) const noexcept
    {
        std::size_t h = std::hash<uint32_t>{}(p.block.index);
        h = h * 31 + std::hash<uint32_t>{}(p.op.index);
        return h * 4 + static_cast<std::size_t>(p.kind);
    }
};

} // namespace strata::ir
