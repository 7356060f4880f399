//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Builder.hpp
// Purpose: Convenience API for constructing IR at an insertion point.
// Key invariants: Every created operation is placed at the current insertion
//                 point; the point stays in front of the anchor op when one
//                 is set, so consecutive creations appear in program order.
// Ownership/Lifetime: The builder borrows the Context; the caller keeps it
//                     alive for the builder's lifetime.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Context.hpp"
#include "ir/ProgramPoint.hpp"

#include <string>
#include <vector>

namespace strata::ir
{

/// @brief Helper to construct operations at a movable insertion point.
class Builder
{
  public:
    explicit Builder(Context &ctx) : ctx_(ctx) {}

    Context &context()
    {
        return ctx_;
    }

    /// @brief Append subsequent operations to the end of @p block.
    void setInsertionPointToEnd(BlockId block)
    {
        block_ = block;
        before_ = OpId();
    }

    /// @brief Insert subsequent operations immediately before @p op.
    void setInsertionPoint(OpId op)
    {
        block_ = ctx_.op(op).parent;
        before_ = op;
    }

    /// @brief Insert subsequent operations immediately after @p op.
    void setInsertionPointAfter(OpId op);

    /// @brief Insert subsequent operations at @p point.
    void setInsertionPoint(const ProgramPoint &point);

    void setLoc(support::SourceLoc loc)
    {
        loc_ = loc;
    }

    //===------------------------------------------------------------------===//
    // Structure
    //===------------------------------------------------------------------===//

    /// @brief Create a detached module op with an empty body block.
    OpId createModule();

    /// @brief Body block of module @p module.
    BlockId moduleBody(OpId module) const;

    /// @brief Create function @p name at the insertion point.
    /// @param params Entry block parameter types.
    /// @param vis Symbol visibility.
    /// @param declaration When true the body region is left empty.
    /// @return The func op; its entry block is entryOf(func).
    OpId func(const std::string &name,
              const std::vector<Type> &params,
              Visibility vis = Visibility::Public,
              bool declaration = false);

    /// @brief Entry block of the first region of @p op.
    BlockId entryOf(OpId op) const;

    /// @brief Append a block with @p params to region @p index of @p op.
    BlockId addBlock(OpId op, const std::vector<Type> &params = {}, unsigned index = 0);

    //===------------------------------------------------------------------===//
    // Values
    //===------------------------------------------------------------------===//

    ValueId constant(int64_t value, Type type = Type(Type::Kind::I64));
    ValueId add(ValueId lhs, ValueId rhs);
    ValueId sub(ValueId lhs, ValueId rhs);
    ValueId mul(ValueId lhs, ValueId rhs);
    ValueId lt(ValueId lhs, ValueId rhs);
    ValueId eq(ValueId lhs, ValueId rhs);

    /// @brief Call @p callee by symbol.
    OpId call(const std::string &callee,
              const std::vector<ValueId> &args,
              const std::vector<Type> &results = {});

    /// @brief Take the address of function @p name.
    ValueId funcRef(const std::string &name);

    /// @brief Opaque side-effecting operation named @p mnemonic.
    OpId exec(const std::string &mnemonic,
              const std::vector<ValueId> &operands,
              const std::vector<Type> &results = {});

    //===------------------------------------------------------------------===//
    // Control flow
    //===------------------------------------------------------------------===//

    OpId br(BlockId dest, const std::vector<ValueId> &args = {});
    OpId condBr(ValueId cond,
                BlockId t,
                const std::vector<ValueId> &targs,
                BlockId f,
                const std::vector<ValueId> &fargs);

    /// @brief Multi-way branch; the successor at the end is the default.
    OpId switchOp(ValueId scrutinee,
                  const std::vector<int64_t> &cases,
                  const std::vector<BlockId> &dests,
                  BlockId defaultDest);

    OpId ret(const std::vector<ValueId> &values = {});
    OpId unreachable();

    /// @brief Structured conditional; regions 0/1 hold the then/else blocks.
    OpId ifOp(ValueId cond, const std::vector<Type> &results = {});

    /// @brief Structured loop.
    /// @details Region 0 ("before") receives @p inits, or the values yielded by
    ///          region 1, and ends in condition. Region 1 ("after") receives
    ///          the forwarded condition values and yields back to region 0.
    ///          The op's results are the values forwarded when the condition
    ///          is false.
    OpId whileOp(const std::vector<ValueId> &inits, const std::vector<Type> &results);

    OpId yield(const std::vector<ValueId> &values = {});
    OpId condition(ValueId cond, const std::vector<ValueId> &values = {});

    //===------------------------------------------------------------------===//
    // Spill pseudo-ops and their lowering
    //===------------------------------------------------------------------===//

    OpId spill(ValueId value);
    OpId reload(ValueId value);
    OpId localStore(int64_t slot, ValueId value);
    OpId localLoad(int64_t slot, Type type);

    /// @brief Result @p index of @p op.
    ValueId result(OpId op, unsigned index = 0) const
    {
        return ctx_.op(op).results[index];
    }

    /// @brief Parameter @p index of @p block.
    ValueId param(BlockId block, unsigned index) const
    {
        return ctx_.block(block).params[index];
    }

  private:
    OpId insert(OpId op);
    ValueId binary(Opcode opcode, ValueId lhs, ValueId rhs, Type type);

    Context &ctx_;
    BlockId block_;
    OpId before_;
    support::SourceLoc loc_;
};

} // namespace strata::ir
