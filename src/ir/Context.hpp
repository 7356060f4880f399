//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Context.hpp
// Purpose: Declares the arena that owns every operation, block, region and
//          value of a compilation unit, together with its mutation API.
// Key invariants: Use lists and block predecessor lists always mirror the
//                 operands and successors stored on operations. Erased
//                 entities keep their slot; their ids are never reused.
// Ownership/Lifetime: The Context owns all entities; callers hold ids.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Ids.hpp"
#include "ir/Opcode.hpp"
#include "ir/Type.hpp"
#include "support/source_location.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace strata::ir
{

/// @brief Symbol visibility of a function.
enum class Visibility
{
    Public,
    Internal,
    Private
};

/// @brief Reference to one operand slot of an operation.
/// @details Group 0 holds the ordinary operands; group s + 1 holds the
///          arguments forwarded to successor s.
struct OpOperand
{
    OpId owner;
    uint32_t group = 0;
    uint32_t index = 0;

    friend bool operator==(const OpOperand &, const OpOperand &) = default;
};

/// @brief Reference to one successor slot of a branch; a predecessor edge.
struct BlockOperand
{
    OpId op;
    uint32_t successor = 0;

    friend bool operator==(const BlockOperand &, const BlockOperand &) = default;
};

/// @brief How a value is defined.
enum class ValueKind
{
    OpResult,
    BlockParam
};

/// @brief SSA value: an operation result or a block parameter.
struct Value
{
    ValueKind kind = ValueKind::OpResult;
    Type type;
    OpId definingOp;              ///< Valid for results.
    BlockId ownerBlock;           ///< Valid for block parameters.
    uint32_t index = 0;           ///< Result or parameter position.
    std::vector<OpOperand> uses;  ///< Every operand slot reading this value.
};

/// @brief Branch target together with its forwarded arguments.
struct Successor
{
    BlockId dest;
    std::vector<ValueId> args;
};

/// @brief Operation stored in the arena.
struct Operation
{
    Opcode opcode = Opcode::Exec;
    BlockId parent;                   ///< Invalid while detached.
    OpId prev;                        ///< Previous op in the parent block.
    OpId next;                        ///< Next op in the parent block.
    std::vector<ValueId> operands;
    std::vector<ValueId> results;
    std::vector<Successor> successors;
    std::vector<RegionId> regions;
    int64_t imm = 0;                  ///< Constant value or local slot index.
    std::vector<int64_t> caseValues;  ///< Switch case values, one per non-default successor.
    std::string symbol;               ///< Function name, callee or exec mnemonic.
    Visibility visibility = Visibility::Private;
    support::SourceLoc loc;
    bool erased = false;
};

/// @brief Basic block: parameters followed by an intrusive list of operations.
struct Block
{
    RegionId parent;
    std::vector<ValueId> params;
    OpId first;
    OpId last;
    std::vector<BlockOperand> predecessors;
    bool erased = false;
};

/// @brief Ordered list of blocks owned by an operation.
struct Region
{
    OpId parentOp;
    uint32_t number = 0;          ///< Position among the parent op's regions.
    std::vector<BlockId> blocks;  ///< First block is the entry.
};

/// @brief Arena owning the IR of a compilation unit.
class Context
{
  public:
    Operation &op(OpId id)
    {
        return ops_[id.index];
    }

    const Operation &op(OpId id) const
    {
        return ops_[id.index];
    }

    Block &block(BlockId id)
    {
        return blocks_[id.index];
    }

    const Block &block(BlockId id) const
    {
        return blocks_[id.index];
    }

    Region &region(RegionId id)
    {
        return regions_[id.index];
    }

    const Region &region(RegionId id) const
    {
        return regions_[id.index];
    }

    Value &value(ValueId id)
    {
        return values_[id.index];
    }

    const Value &value(ValueId id) const
    {
        return values_[id.index];
    }

    std::size_t numBlocks() const
    {
        return blocks_.size();
    }

    std::size_t numValues() const
    {
        return values_.size();
    }

    //===------------------------------------------------------------------===//
    // Creation
    //===------------------------------------------------------------------===//

    /// @brief Create a detached operation.
    /// @param opcode Operation kind.
    /// @param operands Values read by the operation (group 0).
    /// @param resultTypes One result is created per entry.
    /// @param loc Source location of the operation.
    /// @return Id of the new operation; it owns one empty region per
    ///         getOpcodeInfo(opcode).numRegions.
    OpId createOp(Opcode opcode,
                  const std::vector<ValueId> &operands,
                  const std::vector<Type> &resultTypes,
                  support::SourceLoc loc = {});

    /// @brief Append successor @p dest with arguments @p args to @p op.
    void addSuccessor(OpId op, BlockId dest, const std::vector<ValueId> &args);

    /// @brief Append a new block to the end of @p region.
    BlockId createBlock(RegionId region, const std::vector<Type> &params = {});

    /// @brief Insert a new block immediately after @p after in the same region.
    BlockId createBlockAfter(BlockId after, const std::vector<Type> &params = {});

    /// @brief Append a parameter of type @p type to @p block.
    ValueId addBlockParam(BlockId block, Type type);

    /// @brief Remove parameter @p index of @p block and the argument every
    ///        predecessor forwards to it.
    /// @pre The parameter has no remaining uses.
    void eraseBlockParam(BlockId block, uint32_t index);

    //===------------------------------------------------------------------===//
    // Placement
    //===------------------------------------------------------------------===//

    void insertAtEnd(OpId op, BlockId block);
    void insertAtStart(OpId op, BlockId block);
    void insertBefore(OpId op, OpId before);
    void insertAfter(OpId op, OpId after);

    /// @brief Erase @p op together with its nested regions.
    /// @pre None of the results of @p op has remaining uses.
    void eraseOp(OpId op);

    /// @brief Erase an empty-of-predecessors block and its operations.
    /// @pre @p block has no predecessors.
    void eraseBlock(BlockId block);

    //===------------------------------------------------------------------===//
    // Operands and successors
    //===------------------------------------------------------------------===//

    /// @brief Every operand slot of @p op, ordinary operands first.
    std::vector<OpOperand> operandRefs(OpId op) const;

    /// @brief Value stored in operand slot @p ref.
    ValueId operandValue(const OpOperand &ref) const;

    /// @brief Replace the value stored in operand slot @p ref.
    void setOperand(const OpOperand &ref, ValueId value);

    /// @brief Redirect every use of @p from to @p to.
    void replaceAllUsesWith(ValueId from, ValueId to);

    /// @brief Append @p value to the arguments forwarded to successor @p succ.
    void appendSuccessorArg(OpId op, uint32_t succ, ValueId value);

    /// @brief Remove and return the arguments forwarded to successor @p succ.
    std::vector<ValueId> takeSuccessorArgs(OpId op, uint32_t succ);

    /// @brief Point successor @p succ of @p op at @p dest.
    void setSuccessorDest(OpId op, uint32_t succ, BlockId dest);

    //===------------------------------------------------------------------===//
    // Navigation
    //===------------------------------------------------------------------===//

    /// @brief Operations of @p block in order.
    std::vector<OpId> opsIn(BlockId block) const;

    /// @brief Entry block of @p region, or an invalid id when empty.
    BlockId entryBlock(RegionId region) const;

    /// @brief Last operation of @p block if it is a terminator.
    OpId terminator(BlockId block) const;

    /// @brief Operation owning the region that contains @p block.
    OpId parentOp(BlockId block) const;

    /// @brief Operation enclosing @p op, or invalid for a top-level op.
    OpId parentOp(OpId op) const;

    /// @brief Region containing @p op, or invalid when detached.
    RegionId parentRegion(OpId op) const;

    /// @brief Block in which @p value becomes available.
    BlockId definingBlock(ValueId value) const;

    /// @brief Report whether @p ancestor is @p op or encloses it.
    bool isAncestor(OpId ancestor, OpId op) const;

    /// @brief Position of @p block in its region.
    std::size_t blockIndex(BlockId block) const;

    /// @brief Visit @p op and every operation nested in it, parents first.
    void walk(OpId op, const std::function<void(OpId)> &fn) const;

    /// @brief Every block nested in @p op, outer regions before inner ones.
    std::vector<BlockId> nestedBlocks(OpId op) const;

    bool isUsed(ValueId value) const
    {
        return !values_[value.index].uses.empty();
    }

  private:
    std::vector<ValueId> &operandGroup(const OpOperand &ref);
    void addUse(ValueId value, const OpOperand &ref);
    void removeUse(ValueId value, const OpOperand &ref);
    void unlink(OpId op);
    void dropReferences(OpId op);

    std::vector<Operation> ops_;
    std::vector<Block> blocks_;
    std::vector<Region> regions_;
    std::vector<Value> values_;
};

} // namespace strata::ir
