//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Type.cpp
// Purpose: Implements type mnemonics and stack footprints.
// Key invariants: Mnemonics are lowercase and unique per kind.
// Ownership/Lifetime: Stateless helpers.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "ir/Type.hpp"

namespace strata::ir
{

Type::Type(Kind k) : kind(k) {}

/// @brief Return the operand-stack footprint of this type.
/// @details 64-bit integers occupy two 32-bit stack elements on the target.
unsigned Type::stackSlots() const
{
    switch (kind)
    {
        case Kind::Void:
            return 0;
        case Kind::I64:
            return 2;
        case Kind::I1:
        case Kind::I32:
        case Kind::Ptr:
            return 1;
    }
    return 0;
}

std::string kindToString(Type::Kind k)
{
    switch (k)
    {
        case Type::Kind::Void:
            return "void";
        case Type::Kind::I1:
            return "i1";
        case Type::Kind::I32:
            return "i32";
        case Type::Kind::I64:
            return "i64";
        case Type::Kind::Ptr:
            return "ptr";
    }
    return "";
}

std::string Type::toString() const
{
    return kindToString(kind);
}

} // namespace strata::ir
