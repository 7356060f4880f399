//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Type.hpp
// Purpose: Declares the primitive value types of the stack-machine IR.
// Key invariants: Kind field determines the stack footprint.
// Ownership/Lifetime: Types are lightweight values.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace strata::ir
{

/// @brief Simple type wrapper for IR primitive types.
struct Type
{
    /// @brief Enumerates primitive IR types.
    enum class Kind
    {
        Void,
        I1,
        I32,
        I64,
        Ptr
    };

    Kind kind; ///< Discriminator specifying the active kind

    /// @brief Construct a type of kind @p k.
    explicit Type(Kind k = Kind::Void);

    /// @brief Number of operand-stack slots a value of this type occupies.
    unsigned stackSlots() const;

    /// @brief Convert type to string representation.
    /// @return Lowercase type mnemonic.
    std::string toString() const;

    friend bool operator==(const Type &, const Type &) = default;
};

/// @brief Convert kind @p k to its mnemonic string.
std::string kindToString(Type::Kind k);

} // namespace strata::ir
