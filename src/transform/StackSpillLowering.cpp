//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: transform/StackSpillLowering.cpp
// Purpose: Implements frame-slot lowering of the spill pseudo-ops.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "transform/StackSpillLowering.hpp"

#include "ir/Interfaces.hpp"

namespace strata::transform
{

support::Expected<void> StackSpillLowering::createUnconditionalBranch(ir::Builder &builder,
                                                                      ir::BlockId dest,
                                                                      const std::vector<ir::ValueId> &args,
                                                                      support::SourceLoc loc)
{
    builder.setLoc(loc);
    builder.br(dest, args);
    return {};
}

support::Expected<ir::OpId> StackSpillLowering::createSpill(ir::Builder &builder,
                                                            ir::ValueId value,
                                                            support::SourceLoc loc)
{
    builder.setLoc(loc);
    return builder.spill(value);
}

support::Expected<ir::OpId> StackSpillLowering::createReload(ir::Builder &builder,
                                                             ir::ValueId value,
                                                             support::SourceLoc loc)
{
    builder.setLoc(loc);
    return builder.reload(value);
}

support::Expected<void> StackSpillLowering::convertSpillToStore(ir::Builder &builder, ir::OpId spill)
{
    ir::Context &ctx = builder.context();
    const auto pseudo = ir::matchSpillPseudo(ctx, spill);
    const auto *spillLike = pseudo ? std::get_if<ir::SpillLike>(&*pseudo) : nullptr;
    if (!spillLike)
        return support::makeError(ctx.op(spill).loc, "expected a spill operation");

    builder.setLoc(ctx.op(spill).loc);
    builder.localStore(slotFor(spillLike->value), spillLike->value);
    ctx.eraseOp(spill);
    return {};
}

support::Expected<void> StackSpillLowering::convertReloadToLoad(ir::Builder &builder, ir::OpId reload)
{
    ir::Context &ctx = builder.context();
    const auto pseudo = ir::matchSpillPseudo(ctx, reload);
    const auto *reloadLike = pseudo ? std::get_if<ir::ReloadLike>(&*pseudo) : nullptr;
    if (!reloadLike)
        return support::makeError(ctx.op(reload).loc, "expected a reload operation");

    const ir::ValueId reloaded = reloadLike->result;
    const ir::ValueId spilled = reloadLike->value;
    builder.setLoc(ctx.op(reload).loc);
    const ir::OpId load = builder.localLoad(slotFor(spilled), ctx.value(reloaded).type);
    ctx.replaceAllUsesWith(reloaded, builder.result(load));
    ctx.eraseOp(reload);
    return {};
}

int64_t StackSpillLowering::slotFor(ir::ValueId value)
{
    return slots_.emplace(value, static_cast<int64_t>(slots_.size())).first->second;
}

} // namespace strata::transform
