//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/NextUseSet.hpp
// Purpose: Declares the set of SSA values paired with their distance to the
//          next use, the lattice value of the liveness analysis.
// Key invariants: A value appears at most once. A missing value has no known
//                 use; kDead marks a value known to be unused.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "analysis/dataflow/AnalysisState.hpp"
#include "ir/Ids.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <ostream>
#include <vector>

namespace strata::analysis::dataflow
{

/// @brief Value paired with the number of steps until it is next used.
struct NextUse
{
    ir::ValueId value;
    uint32_t distance = 0;

    friend bool operator==(const NextUse &, const NextUse &) = default;
};

/// @brief Next-use distances of a set of values, ordered by value id.
class NextUseSet
{
  public:
    /// @brief Distance of a value with no further use.
    static constexpr uint32_t kDead = std::numeric_limits<uint32_t>::max();

    using Map = std::map<ir::ValueId, uint32_t>;
    using const_iterator = Map::const_iterator;

    /// @brief Add @p value, keeping the smaller distance if already present.
    ChangeResult insert(ir::ValueId value, uint32_t distance);

    /// @brief Remove @p value, returning its distance if it was present.
    std::optional<uint32_t> remove(ir::ValueId value);

    /// @brief Report whether @p value has a finite next use.
    bool isLive(ir::ValueId value) const
    {
        return distance(value) < kDead;
    }

    bool contains(ir::ValueId value) const
    {
        return entries_.count(value) != 0;
    }

    /// @brief Distance to the next use of @p value; kDead when absent.
    uint32_t distance(ir::ValueId value) const;

    std::optional<NextUse> get(ir::ValueId value) const;

    /// @brief Values present in either set with the smaller distance.
    NextUseSet unionWith(const NextUseSet &other) const;

    /// @brief Values present in both sets with the smaller distance.
    NextUseSet intersection(const NextUseSet &other) const;

    /// @brief Values present in exactly one of the sets.
    NextUseSet symmetricDifference(const NextUseSet &other) const;

    /// @brief Values with a finite distance, in id order.
    std::vector<ir::ValueId> live() const;

    /// @brief Remove and return the entry with the smallest distance.
    /// @details Ties are broken by the smaller value id.
    std::optional<NextUse> popFirst();

    /// @brief Remove and return the entry with the largest distance.
    /// @details Ties are broken by the larger value id.
    std::optional<NextUse> popLast();

    /// @brief Add @p delta to every distance, saturating at kDead.
    void incrementAll(uint32_t delta);

    /// @brief Union with @p other in place.
    ChangeResult join(const NextUseSet &other);

    void clear()
    {
        entries_.clear();
    }

    std::size_t size() const
    {
        return entries_.size();
    }

    bool empty() const
    {
        return entries_.empty();
    }

    const_iterator begin() const
    {
        return entries_.begin();
    }

    const_iterator end() const
    {
        return entries_.end();
    }

    friend bool operator==(const NextUseSet &, const NextUseSet &) = default;

  private:
    Map entries_;
};

inline NextUseSet operator|(const NextUseSet &lhs, const NextUseSet &rhs)
{
    return lhs.unionWith(rhs);
}

inline NextUseSet operator&(const NextUseSet &lhs, const NextUseSet &rhs)
{
    return lhs.intersection(rhs);
}

inline NextUseSet operator^(const NextUseSet &lhs, const NextUseSet &rhs)
{
    return lhs.symmetricDifference(rhs);
}

std::ostream &operator<<(std::ostream &os, const NextUseSet &set);

inline uint32_t saturatingAdd(uint32_t lhs, uint32_t rhs)
{
    const uint64_t sum = static_cast<uint64_t>(lhs) + rhs;
    return sum >= NextUseSet::kDead ? NextUseSet::kDead : static_cast<uint32_t>(sum);
}

} // namespace strata::analysis::dataflow
