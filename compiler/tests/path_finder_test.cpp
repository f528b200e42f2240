//! # Constraint Path Finder Tests

#include "blame/path_finder.hpp"
#include "region_fixture.hpp"

#include <gtest/gtest.h>

using regionck::blame::BlamePath;
using regionck::blame::ConstraintPathFinder;

class PathFinderTest : public RegionFixture {
protected:
    static auto is(RegionVid target) {
        return [target](RegionVid r) { return r == target; };
    }
};

TEST_F(PathFinderTest, FindsChainInOrder) {
    auto r0 = add_region();
    auto r1 = add_region();
    auto r2 = add_region();
    outlives(r0, r1, ConstraintCategory::Assignment);
    outlives(r1, r2, ConstraintCategory::CallArgument);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    auto path = finder.find_path(r0, is(r2));

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->target, r2);
    ASSERT_EQ(path->constraints.size(), 2u);
    EXPECT_EQ(path->constraints[0].sup, r0);
    EXPECT_EQ(path->constraints[0].sub, r1);
    EXPECT_EQ(path->constraints[1].sup, r1);
    EXPECT_EQ(path->constraints[1].sub, r2);
}

TEST_F(PathFinderTest, ReturnsShortestPath) {
    auto r0 = add_region();
    auto r1 = add_region();
    auto r2 = add_region();
    auto r3 = add_region();
    // Long way first in enumeration order; the direct edge must still win.
    outlives(r0, r1);
    outlives(r1, r2);
    outlives(r2, r3);
    outlives(r0, r3, ConstraintCategory::Cast);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    auto path = finder.find_path(r0, is(r3));

    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->constraints.size(), 1u);
    EXPECT_EQ(path->constraints[0].category, ConstraintCategory::Cast);
}

TEST_F(PathFinderTest, TiesBrokenByEnumerationOrder) {
    auto r0 = add_region();
    auto via_first = add_region();
    auto via_second = add_region();
    auto target = add_region();
    outlives(r0, via_first);
    outlives(r0, via_second);
    outlives(via_second, target, ConstraintCategory::Return);
    outlives(via_first, target, ConstraintCategory::Cast);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    auto path = finder.find_path(r0, is(target));

    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->constraints.size(), 2u);
    EXPECT_EQ(path->constraints[0].sub, via_first);
    EXPECT_EQ(path->constraints[1].category, ConstraintCategory::Cast);
}

TEST_F(PathFinderTest, StartSatisfyingTargetGivesEmptyPath) {
    auto r0 = add_region();
    auto r1 = add_region();
    outlives(r0, r1);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    auto path = finder.find_path(r0, is(r0));

    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(path->constraints.empty());
    EXPECT_EQ(path->target, r0);
}

TEST_F(PathFinderTest, UnreachableTargetGivesNothing) {
    auto r0 = add_region();
    auto r1 = add_region();
    auto r2 = add_region();
    outlives(r0, r1);
    outlives(r2, r0);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    EXPECT_FALSE(finder.find_path(r0, is(r2)).has_value());
}

TEST_F(PathFinderTest, CyclesTerminate) {
    auto r0 = add_region();
    auto r1 = add_region();
    auto r2 = add_region();
    outlives(r0, r1);
    outlives(r1, r0);
    outlives(r1, r1);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    EXPECT_FALSE(finder.find_path(r0, is(r2)).has_value());
}

TEST_F(PathFinderTest, SearchThroughStaticUsesImplicitEdges) {
    auto r0 = add_region();
    auto r1 = add_region();
    outlives(r0, static_r, ConstraintCategory::Return);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    auto path = finder.find_path(r0, is(r1));

    ASSERT_TRUE(path.has_value());
    ASSERT_EQ(path->constraints.size(), 2u);
    EXPECT_EQ(path->constraints[0].category, ConstraintCategory::Return);
    EXPECT_EQ(path->constraints[1].sup, static_r);
    EXPECT_EQ(path->constraints[1].sub, r1);
    EXPECT_EQ(path->constraints[1].category, ConstraintCategory::Internal);
}

TEST_F(PathFinderTest, AcceptsArbitraryPredicates) {
    auto r0 = add_region();
    auto r1 = add_region(RegionKind::External, "'a");
    auto r2 = add_region(RegionKind::External, "'b");
    outlives(r0, r1);
    outlives(r1, r2);

    auto ctx = build();
    ConstraintPathFinder finder(*ctx);
    const auto& context = *ctx;
    auto path = finder.find_path(r0, [&context](RegionVid r) {
        return context.definition(r).kind == RegionKind::External;
    });

    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->target, r1);
}
