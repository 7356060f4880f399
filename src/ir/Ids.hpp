//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ir/Ids.hpp
// Purpose: Declares the dense integer handles used to address IR entities.
// Key invariants: A default-constructed id is invalid; ids are stable for the
//                 lifetime of the owning Context, even after the entity is erased.
// Ownership/Lifetime: Plain value types; the Context owns the entities.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace strata::ir
{

/// @brief Typed index into one of the Context arenas.
/// @tparam Tag Distinguishes operation, block, region and value handles.
template <typename Tag> struct EntityId
{
    static constexpr uint32_t kInvalid = UINT32_MAX;

    uint32_t index = kInvalid;

    constexpr EntityId() = default;

    constexpr explicit EntityId(uint32_t i) : index(i) {}

    [[nodiscard]] constexpr bool isValid() const
    {
        return index != kInvalid;
    }

    friend constexpr bool operator==(const EntityId &, const EntityId &) = default;
    friend constexpr auto operator<=>(const EntityId &, const EntityId &) = default;
};

struct OpTag
{
};
struct BlockTag
{
};
struct RegionTag
{
};
struct ValueTag
{
};

using OpId = EntityId<OpTag>;
using BlockId = EntityId<BlockTag>;
using RegionId = EntityId<RegionTag>;
using ValueId = EntityId<ValueTag>;

} // namespace strata::ir

namespace std
{
template <typename Tag> struct hash<strata::ir::EntityId<Tag>>
{
    std::size_t operator()(const strata::ir::EntityId<Tag> &id) const noexcept
    {
        return std::hash<uint32_t>{}(id.index);
    }
};
} // namespace std
