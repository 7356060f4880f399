//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/unit/test_analysis_next_use_set.cpp
// Purpose: Check the next-use distance lattice: minimum-keeping insertion,
//          set algebra, saturation and extraction order.
// Key invariants: A value maps to its smallest known distance; kDead marks a
//                 value that is defined but never used again.
// Ownership/Lifetime: Sets are plain values owned by each test.
// Links: docs/codemap.md
//
//===----------------------------------------------------------------------===//

#include "analysis/dataflow/NextUseSet.hpp"

#include <gtest/gtest.h>

#include <sstream>

using strata::analysis::dataflow::ChangeResult;
using strata::analysis::dataflow::NextUseSet;
using strata::ir::ValueId;

namespace
{

const ValueId kA{1};
const ValueId kB{2};
const ValueId kC{3};

NextUseSet makeSet(std::initializer_list<std::pair<ValueId, uint32_t>> entries)
{
    NextUseSet set;
    for (const auto &[value, distance] : entries)
        set.insert(value, distance);
    return set;
}

} // namespace

TEST(NextUseSetTest, InsertKeepsTheSmallestDistance)
{
    NextUseSet set;
    EXPECT_EQ(set.insert(kA, 5), ChangeResult::Changed);
    EXPECT_EQ(set.insert(kA, 7), ChangeResult::Unchanged);
    EXPECT_EQ(set.distance(kA), 5u);
    EXPECT_EQ(set.insert(kA, 2), ChangeResult::Changed);
    EXPECT_EQ(set.distance(kA), 2u);
    EXPECT_EQ(set.insert(kA, 2), ChangeResult::Unchanged);
}

TEST(NextUseSetTest, DeadEntriesAreKnownButNotLive)
{
    NextUseSet set;
    set.insert(kA, NextUseSet::kDead);
    set.insert(kB, 0);

    EXPECT_TRUE(set.contains(kA));
    EXPECT_FALSE(set.isLive(kA));
    EXPECT_TRUE(set.isLive(kB));
    EXPECT_FALSE(set.contains(kC));
    EXPECT_EQ(set.distance(kC), NextUseSet::kDead);

    const std::vector<ValueId> live = set.live();
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live.front(), kB);
}

TEST(NextUseSetTest, RemoveReportsThePreviousDistance)
{
    NextUseSet set = makeSet({{kA, 4}});
    EXPECT_EQ(set.remove(kA), std::optional<uint32_t>(4));
    EXPECT_FALSE(set.remove(kA).has_value());
    EXPECT_TRUE(set.empty());
}

TEST(NextUseSetTest, IncrementSaturatesAtDead)
{
    NextUseSet set = makeSet({{kA, 1}, {kB, NextUseSet::kDead - 1}, {kC, NextUseSet::kDead}});
    set.incrementAll(3);
    EXPECT_EQ(set.distance(kA), 4u);
    EXPECT_EQ(set.distance(kB), NextUseSet::kDead);
    EXPECT_EQ(set.distance(kC), NextUseSet::kDead);
}

TEST(NextUseSetTest, UnionAndIntersectionTakeMinimumDistances)
{
    const NextUseSet lhs = makeSet({{kA, 3}, {kB, 9}});
    const NextUseSet rhs = makeSet({{kB, 4}, {kC, 1}});

    const NextUseSet both = lhs | rhs;
    EXPECT_EQ(both.size(), 3u);
    EXPECT_EQ(both.distance(kA), 3u);
    EXPECT_EQ(both.distance(kB), 4u);
    EXPECT_EQ(both.distance(kC), 1u);

    const NextUseSet common = lhs & rhs;
    EXPECT_EQ(common.size(), 1u);
    EXPECT_EQ(common.distance(kB), 4u);

    const NextUseSet diff = lhs ^ rhs;
    EXPECT_EQ(diff.size(), 2u);
    EXPECT_EQ(diff.distance(kA), 3u);
    EXPECT_EQ(diff.distance(kC), 1u);
    EXPECT_FALSE(diff.contains(kB));
}

TEST(NextUseSetTest, JoinReportsChangesOnlyForImprovements)
{
    NextUseSet set = makeSet({{kA, 2}});
    EXPECT_EQ(set.join(makeSet({{kA, 6}})), ChangeResult::Unchanged);
    EXPECT_EQ(set.join(makeSet({{kA, 1}})), ChangeResult::Changed);
    EXPECT_EQ(set.join(makeSet({{kB, 8}})), ChangeResult::Changed);
    EXPECT_EQ(set, makeSet({{kA, 1}, {kB, 8}}));
}

TEST(NextUseSetTest, PopOrdersByDistance)
{
    NextUseSet set = makeSet({{kA, 5}, {kB, 1}, {kC, 9}});

    auto nearest = set.popFirst();
    ASSERT_TRUE(nearest.has_value());
    EXPECT_EQ(nearest->value, kB);
    EXPECT_EQ(nearest->distance, 1u);

    auto farthest = set.popLast();
    ASSERT_TRUE(farthest.has_value());
    EXPECT_EQ(farthest->value, kC);

    EXPECT_EQ(set.size(), 1u);
    EXPECT_EQ(set.popFirst()->value, kA);
    EXPECT_FALSE(set.popLast().has_value());
}

TEST(NextUseSetTest, PrintsDeadEntries)
{
    std::ostringstream os;
    os << makeSet({{kA, 0}, {kB, NextUseSet::kDead}});
    EXPECT_EQ(os.str(), "{%1:0, %2:dead}");
}
