//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/common/IrFixture.hpp
// Purpose: Shared scaffolding for unit tests that build IR by hand: a module,
//          a builder and shorthands for the common types.
// Key invariants: Functions are appended to the fixture's module so symbol
//                 lookups and visibility rules behave as in real input.
// Ownership/Lifetime: The fixture owns the Context; ids it hands out are only
//                     meaningful while it is alive.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "ir/Builder.hpp"

#include <string>
#include <vector>

namespace strata::tests
{

inline ir::Type i1()
{
    return ir::Type(ir::Type::Kind::I1);
}

inline ir::Type i64()
{
    return ir::Type(ir::Type::Kind::I64);
}

/// @brief Context, builder and top-level module for one test.
struct IrFixture
{
    ir::Context ctx;
    ir::Builder builder{ctx};
    ir::OpId module = builder.createModule();

    /// @brief Append function @p name to the module and position the builder
    ///        at the end of its entry block.
    ir::OpId addFunction(const std::string &name,
                         const std::vector<ir::Type> &params = {},
                         ir::Visibility vis = ir::Visibility::Public)
    {
        builder.setInsertionPointToEnd(builder.moduleBody(module));
        const ir::OpId fn = builder.func(name, params, vis);
        builder.setInsertionPointToEnd(builder.entryOf(fn));
        return fn;
    }

    ir::RegionId regionOf(ir::OpId op, unsigned index = 0) const
    {
        return ctx.op(op).regions[index];
    }

    ir::BlockId entryOf(ir::OpId op) const
    {
        return builder.entryOf(op);
    }

    /// @brief Opaque value producer that constant propagation cannot fold.
    ir::ValueId opaque(const std::string &name, ir::Type type = i64())
    {
        return builder.result(builder.exec(name, {}, {type}));
    }

    void at(ir::BlockId block)
    {
        builder.setInsertionPointToEnd(block);
    }
};

} // namespace strata::tests
