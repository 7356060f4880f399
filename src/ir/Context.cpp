//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Context.cpp
// Purpose: Implements creation, placement and use-list maintenance for the
//          IR arena.
// Key invariants: Every operand slot has exactly one matching entry in the
//                 use list of the value it reads; every successor slot has
//                 exactly one matching predecessor entry on its destination.
// Ownership/Lifetime: Entities are never deallocated; erased slots are
//                     flagged and skipped by navigation helpers.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Context.hpp"

#include <algorithm>
#include <cassert>

namespace strata::ir
{

OpId Context::createOp(Opcode opcode,
                       const std::vector<ValueId> &operands,
                       const std::vector<Type> &resultTypes,
                       support::SourceLoc loc)
{
    OpId id(static_cast<uint32_t>(ops_.size()));
    ops_.emplace_back();
    ops_.back().opcode = opcode;
    ops_.back().loc = loc;

    for (uint32_t i = 0; i < operands.size(); ++i)
    {
        ops_[id.index].operands.push_back(operands[i]);
        addUse(operands[i], OpOperand{id, 0, i});
    }

    for (uint32_t i = 0; i < resultTypes.size(); ++i)
    {
        ValueId v(static_cast<uint32_t>(values_.size()));
        Value val;
        val.kind = ValueKind::OpResult;
        val.type = resultTypes[i];
        val.definingOp = id;
        val.index = i;
        values_.push_back(std::move(val));
        ops_[id.index].results.push_back(v);
    }

    const unsigned numRegions = getOpcodeInfo(opcode).numRegions;
    for (uint32_t r = 0; r < numRegions; ++r)
    {
        RegionId rid(static_cast<uint32_t>(regions_.size()));
        Region region;
        region.parentOp = id;
        region.number = r;
        regions_.push_back(std::move(region));
        ops_[id.index].regions.push_back(rid);
    }
    return id;
}

void Context::addSuccessor(OpId op, BlockId dest, const std::vector<ValueId> &args)
{
    Operation &o = ops_[op.index];
    const auto succ = static_cast<uint32_t>(o.successors.size());
    o.successors.push_back(Successor{dest, {}});
    blocks_[dest.index].predecessors.push_back(BlockOperand{op, succ});
    for (ValueId arg : args)
        appendSuccessorArg(op, succ, arg);
}

BlockId Context::createBlock(RegionId region, const std::vector<Type> &params)
{
    BlockId id(static_cast<uint32_t>(blocks_.size()));
    blocks_.emplace_back();
    blocks_.back().parent = region;
    regions_[region.index].blocks.push_back(id);
    for (const Type &t : params)
        addBlockParam(id, t);
    return id;
}

BlockId Context::createBlockAfter(BlockId after, const std::vector<Type> &params)
{
    const RegionId region = blocks_[after.index].parent;
    BlockId id(static_cast<uint32_t>(blocks_.size()));
    blocks_.emplace_back();
    blocks_.back().parent = region;
    auto &list = regions_[region.index].blocks;
    auto it = std::find(list.begin(), list.end(), after);
    assert(it != list.end() && "block missing from its region");
    list.insert(it + 1, id);
    for (const Type &t : params)
        addBlockParam(id, t);
    return id;
}

ValueId Context::addBlockParam(BlockId block, Type type)
{
    ValueId v(static_cast<uint32_t>(values_.size()));
    Value val;
    val.kind = ValueKind::BlockParam;
    val.type = type;
    val.ownerBlock = block;
    val.index = static_cast<uint32_t>(blocks_[block.index].params.size());
    values_.push_back(std::move(val));
    blocks_[block.index].params.push_back(v);
    return v;
}

void Context::eraseBlockParam(BlockId block, uint32_t index)
{
    Block &b = blocks_[block.index];
    assert(index < b.params.size() && "block parameter out of range");
    assert(values_[b.params[index].index].uses.empty() && "erasing a used block parameter");
    for (const BlockOperand &pred : b.predecessors)
    {
        auto &args = ops_[pred.op.index].successors[pred.successor].args;
        const uint32_t group = pred.successor + 1;
        removeUse(args[index], OpOperand{pred.op, group, index});
        for (uint32_t i = index + 1; i < args.size(); ++i)
        {
            auto &uses = values_[args[i].index].uses;
            std::replace(uses.begin(), uses.end(), OpOperand{pred.op, group, i}, OpOperand{pred.op, group, i - 1});
        }
        args.erase(args.begin() + index);
    }
    b.params.erase(b.params.begin() + index);
    for (uint32_t i = index; i < b.params.size(); ++i)
        values_[b.params[i].index].index = i;
}

void Context::insertAtEnd(OpId op, BlockId block)
{
    Operation &o = ops_[op.index];
    Block &b = blocks_[block.index];
    assert(!o.parent.isValid() && "operation already placed");
    o.parent = block;
    o.prev = b.last;
    o.next = OpId();
    if (b.last.isValid())
        ops_[b.last.index].next = op;
    else
        b.first = op;
    b.last = op;
}

void Context::insertAtStart(OpId op, BlockId block)
{
    Block &b = blocks_[block.index];
    if (b.first.isValid())
    {
        insertBefore(op, b.first);
        return;
    }
    insertAtEnd(op, block);
}

void Context::insertBefore(OpId op, OpId before)
{
    Operation &o = ops_[op.index];
    Operation &anchor = ops_[before.index];
    assert(!o.parent.isValid() && "operation already placed");
    Block &b = blocks_[anchor.parent.index];
    o.parent = anchor.parent;
    o.next = before;
    o.prev = anchor.prev;
    if (anchor.prev.isValid())
        ops_[anchor.prev.index].next = op;
    else
        b.first = op;
    anchor.prev = op;
}

void Context::insertAfter(OpId op, OpId after)
{
    Operation &anchor = ops_[after.index];
    if (anchor.next.isValid())
    {
        insertBefore(op, anchor.next);
        return;
    }
    insertAtEnd(op, anchor.parent);
}

void Context::unlink(OpId op)
{
    Operation &o = ops_[op.index];
    if (!o.parent.isValid())
        return;
    Block &b = blocks_[o.parent.index];
    if (o.prev.isValid())
        ops_[o.prev.index].next = o.next;
    else
        b.first = o.next;
    if (o.next.isValid())
        ops_[o.next.index].prev = o.prev;
    else
        b.last = o.prev;
    o.parent = BlockId();
    o.prev = OpId();
    o.next = OpId();
}

/// Remove the uses and predecessor edges contributed by @p op and by
/// everything nested inside it.
void Context::dropReferences(OpId op)
{
    Operation &o = ops_[op.index];
    for (const OpOperand &ref : operandRefs(op))
        removeUse(operandValue(ref), ref);
    for (uint32_t s = 0; s < o.successors.size(); ++s)
    {
        auto &preds = blocks_[o.successors[s].dest.index].predecessors;
        preds.erase(std::remove(preds.begin(), preds.end(), BlockOperand{op, s}), preds.end());
    }
    for (RegionId r : o.regions)
        for (BlockId b : regions_[r.index].blocks)
            for (OpId inner : opsIn(b))
                dropReferences(inner);
}

void Context::eraseOp(OpId op)
{
    for ([[maybe_unused]] ValueId r : ops_[op.index].results)
        assert(values_[r.index].uses.empty() && "erasing an operation whose results are used");

    dropReferences(op);
    unlink(op);

    std::vector<OpId> worklist{op};
    while (!worklist.empty())
    {
        OpId cur = worklist.back();
        worklist.pop_back();
        Operation &o = ops_[cur.index];
        o.erased = true;
        for (RegionId r : o.regions)
        {
            for (BlockId b : regions_[r.index].blocks)
            {
                for (OpId inner : opsIn(b))
                    worklist.push_back(inner);
                blocks_[b.index].erased = true;
            }
        }
    }
}

void Context::eraseBlock(BlockId block)
{
    assert(blocks_[block.index].predecessors.empty() && "erasing a block with predecessors");
    std::vector<OpId> ops = opsIn(block);
    for (OpId op : ops)
        dropReferences(op);
    for (auto it = ops.rbegin(); it != ops.rend(); ++it)
        eraseOp(*it);

    Block &b = blocks_[block.index];
    auto &list = regions_[b.parent.index].blocks;
    list.erase(std::remove(list.begin(), list.end(), block), list.end());
    b.erased = true;
}

std::vector<OpOperand> Context::operandRefs(OpId op) const
{
    const Operation &o = ops_[op.index];
    std::vector<OpOperand> refs;
    for (uint32_t i = 0; i < o.operands.size(); ++i)
        refs.push_back(OpOperand{op, 0, i});
    for (uint32_t s = 0; s < o.successors.size(); ++s)
        for (uint32_t i = 0; i < o.successors[s].args.size(); ++i)
            refs.push_back(OpOperand{op, s + 1, i});
    return refs;
}

std::vector<ValueId> &Context::operandGroup(const OpOperand &ref)
{
    Operation &o = ops_[ref.owner.index];
    if (ref.group == 0)
        return o.operands;
    return o.successors[ref.group - 1].args;
}

ValueId Context::operandValue(const OpOperand &ref) const
{
    const Operation &o = ops_[ref.owner.index];
    if (ref.group == 0)
        return o.operands[ref.index];
    return o.successors[ref.group - 1].args[ref.index];
}

void Context::setOperand(const OpOperand &ref, ValueId value)
{
    ValueId &slot = operandGroup(ref)[ref.index];
    if (slot == value)
        return;
    removeUse(slot, ref);
    slot = value;
    addUse(value, ref);
}

void Context::replaceAllUsesWith(ValueId from, ValueId to)
{
    if (from == to)
        return;
    std::vector<OpOperand> uses = std::move(values_[from.index].uses);
    values_[from.index].uses.clear();
    for (const OpOperand &ref : uses)
    {
        operandGroup(ref)[ref.index] = to;
        addUse(to, ref);
    }
}

void Context::appendSuccessorArg(OpId op, uint32_t succ, ValueId value)
{
    auto &args = ops_[op.index].successors[succ].args;
    const auto index = static_cast<uint32_t>(args.size());
    args.push_back(value);
    addUse(value, OpOperand{op, succ + 1, index});
}

std::vector<ValueId> Context::takeSuccessorArgs(OpId op, uint32_t succ)
{
    auto &args = ops_[op.index].successors[succ].args;
    for (uint32_t i = 0; i < args.size(); ++i)
        removeUse(args[i], OpOperand{op, succ + 1, i});
    std::vector<ValueId> taken = std::move(args);
    args.clear();
    return taken;
}

void Context::setSuccessorDest(OpId op, uint32_t succ, BlockId dest)
{
    Successor &s = ops_[op.index].successors[succ];
    if (s.dest == dest)
        return;
    auto &oldPreds = blocks_[s.dest.index].predecessors;
    oldPreds.erase(std::remove(oldPreds.begin(), oldPreds.end(), BlockOperand{op, succ}),
                   oldPreds.end());
    s.dest = dest;
    blocks_[dest.index].predecessors.push_back(BlockOperand{op, succ});
}

std::vector<OpId> Context::opsIn(BlockId block) const
{
    std::vector<OpId> out;
    for (OpId cur = blocks_[block.index].first; cur.isValid(); cur = ops_[cur.index].next)
        out.push_back(cur);
    return out;
}

BlockId Context::entryBlock(RegionId region) const
{
    const auto &list = regions_[region.index].blocks;
    return list.empty() ? BlockId() : list.front();
}

OpId Context::terminator(BlockId block) const
{
    OpId last = blocks_[block.index].last;
    if (last.isValid() && getOpcodeInfo(ops_[last.index].opcode).isTerminator)
        return last;
    return OpId();
}

OpId Context::parentOp(BlockId block) const
{
    return regions_[blocks_[block.index].parent.index].parentOp;
}

OpId Context::parentOp(OpId op) const
{
    BlockId b = ops_[op.index].parent;
    if (!b.isValid())
        return OpId();
    return parentOp(b);
}

RegionId Context::parentRegion(OpId op) const
{
    BlockId b = ops_[op.index].parent;
    if (!b.isValid())
        return RegionId();
    return blocks_[b.index].parent;
}

BlockId Context::definingBlock(ValueId value) const
{
    const Value &v = values_[value.index];
    if (v.kind == ValueKind::BlockParam)
        return v.ownerBlock;
    return ops_[v.definingOp.index].parent;
}

bool Context::isAncestor(OpId ancestor, OpId op) const
{
    for (OpId cur = op; cur.isValid(); cur = parentOp(cur))
        if (cur == ancestor)
            return true;
    return false;
}

std::size_t Context::blockIndex(BlockId block) const
{
    const auto &list = regions_[blocks_[block.index].parent.index].blocks;
    auto it = std::find(list.begin(), list.end(), block);
    assert(it != list.end() && "block missing from its region");
    return static_cast<std::size_t>(it - list.begin());
}

void Context::walk(OpId op, const std::function<void(OpId)> &fn) const
{
    fn(op);
    for (RegionId r : ops_[op.index].regions)
        for (BlockId b : regions_[r.index].blocks)
            for (OpId cur = blocks_[b.index].first; cur.isValid(); cur = ops_[cur.index].next)
                walk(cur, fn);
}

std::vector<BlockId> Context::nestedBlocks(OpId op) const
{
    std::vector<BlockId> blocks;
    walk(op,
         [&](OpId cur)
         {
             for (RegionId r : ops_[cur.index].regions)
                 for (BlockId b : regions_[r.index].blocks)
                     blocks.push_back(b);
         });
    return blocks;
}

void Context::addUse(ValueId value, const OpOperand &ref)
{
    values_[value.index].uses.push_back(ref);
}

void Context::removeUse(ValueId value, const OpOperand &ref)
{
    auto &uses = values_[value.index].uses;
    auto it = std::find(uses.begin(), uses.end(), ref);
    if (it != uses.end())
        uses.erase(it);
}

} // namespace strata::ir
