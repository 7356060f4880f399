//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: analysis/dataflow/NextUseSet.cpp
// Purpose: Implements next-use set algebra.
// Key invariants: Joins keep the minimum distance of each value.
// Ownership/Lifetime: Value type.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/NextUseSet.hpp"

#include <algorithm>
#include <iterator>

namespace strata::analysis::dataflow
{

ChangeResult NextUseSet::insert(ir::ValueId value, uint32_t distance)
{
    auto [it, inserted] = entries_.emplace(value, distance);
    if (inserted)
        return ChangeResult::Changed;
    if (distance >= it->second)
        return ChangeResult::Unchanged;
    it->second = distance;
    return ChangeResult::Changed;
}

std::optional<uint32_t> NextUseSet::remove(ir::ValueId value)
{
    auto it = entries_.find(value);
    if (it == entries_.end())
        return std::nullopt;
    uint32_t distance = it->second;
    entries_.erase(it);
    return distance;
}

uint32_t NextUseSet::distance(ir::ValueId value) const
{
    auto it = entries_.find(value);
    return it == entries_.end() ? kDead : it->second;
}

std::optional<NextUse> NextUseSet::get(ir::ValueId value) const
{
    auto it = entries_.find(value);
    if (it == entries_.end())
        return std::nullopt;
    return NextUse{it->first, it->second};
}

NextUseSet NextUseSet::unionWith(const NextUseSet &other) const
{
    NextUseSet result = *this;
    result.join(other);
    return result;
}

NextUseSet NextUseSet::intersection(const NextUseSet &other) const
{
    NextUseSet result;
    for (const auto &[value, dist] : entries_)
    {
        auto it = other.entries_.find(value);
        if (it != other.entries_.end())
            result.entries_.emplace(value, std::min(dist, it->second));
    }
    return result;
}

NextUseSet NextUseSet::symmetricDifference(const NextUseSet &other) const
{
    NextUseSet result;
    for (const auto &[value, dist] : entries_)
        if (!other.contains(value))
            result.entries_.emplace(value, dist);
    for (const auto &[value, dist] : other.entries_)
        if (!contains(value))
            result.entries_.emplace(value, dist);
    return result;
}

std::vector<ir::ValueId> NextUseSet::live() const
{
    std::vector<ir::ValueId> values;
    for (const auto &[value, dist] : entries_)
        if (dist < kDead)
            values.push_back(value);
    return values;
}

std::optional<NextUse> NextUseSet::popFirst()
{
    if (entries_.empty())
        return std::nullopt;
    auto best = entries_.begin();
    for (auto it = std::next(best); it != entries_.end(); ++it)
        if (it->second < best->second)
            best = it;
    NextUse result{best->first, best->second};
    entries_.erase(best);
    return result;
}

std::optional<NextUse> NextUseSet::popLast()
{
    if (entries_.empty())
        return std::nullopt;
    auto best = entries_.begin();
    for (auto it = std::next(best); it != entries_.end(); ++it)
        if (it->second >= best->second)
            best = it;
    NextUse result{best->first, best->second};
    entries_.erase(best);
    return result;
}

void NextUseSet::incrementAll(uint32_t delta)
{
    for (auto &entry : entries_)
        entry.second = saturatingAdd(entry.second, delta);
}

ChangeResult NextUseSet::join(const NextUseSet &other)
{
    ChangeResult changed = ChangeResult::Unchanged;
    for (const auto &[value, dist] : other.entries_)
        changed |= insert(value, dist);
    return changed;
}

std::ostream &operator<<(std::ostream &os, const NextUseSet &set)
{
    os << "{";
    bool first = true;
    for (const auto &[value, dist] : set)
    {
        os << (first ? "" : ", ") << "%" << value.index << ":";
        if (dist == NextUseSet::kDead)
            os << "dead";
        else
            os << dist;
        first = false;
    }
    return os << "}";
}

} // namespace strata::analysis::dataflow
