//! # Constraint Graph Tests
//!
//! Categories and their phrases, edge enumeration (implicit `'static` edges
//! included), SCC computation and context validation.

#include "region_fixture.hpp"

#include <gtest/gtest.h>
#include <sstream>

// ============================================================================
// Constraint Categories
// ============================================================================

TEST(ConstraintCategoryTest, PhrasesEndInOneSpaceOrAreEmpty) {
    for (size_t i = 0; i < CONSTRAINT_CATEGORY_COUNT; ++i) {
        auto category = static_cast<ConstraintCategory>(i);
        auto phrase = category_phrase(category);
        if (category == ConstraintCategory::Boring ||
            category == ConstraintCategory::BoringNoLocation ||
            category == ConstraintCategory::Internal) {
            EXPECT_TRUE(phrase.empty()) << category;
            continue;
        }
        ASSERT_GE(phrase.size(), 2u) << category;
        EXPECT_EQ(phrase.back(), ' ') << category;
        EXPECT_NE(phrase[phrase.size() - 2], ' ') << category;
    }
}

TEST(ConstraintCategoryTest, KnownPhrases) {
    EXPECT_EQ(category_phrase(ConstraintCategory::Assignment), "assignment ");
    EXPECT_EQ(category_phrase(ConstraintCategory::Return), "returning this value ");
    EXPECT_EQ(category_phrase(ConstraintCategory::CallArgument), "argument ");
    EXPECT_EQ(category_phrase(ConstraintCategory::SizedBound), "proving this value is `Sized` ");
    EXPECT_EQ(category_phrase(ConstraintCategory::CopyBound), "copying this value ");
    EXPECT_EQ(category_phrase(ConstraintCategory::OpaqueType), "opaque type ");
}

TEST(ConstraintCategoryTest, NamesParseBack) {
    for (size_t i = 0; i < CONSTRAINT_CATEGORY_COUNT; ++i) {
        auto category = static_cast<ConstraintCategory>(i);
        auto parsed = parse_category(category_name(category));
        ASSERT_TRUE(parsed.has_value()) << category;
        EXPECT_EQ(*parsed, category);
    }
    EXPECT_EQ(category_name(ConstraintCategory::BoringNoLocation), "boring_no_location");
    EXPECT_FALSE(parse_category("CallArgument").has_value());
}

TEST(ConstraintCategoryTest, Uninteresting) {
    EXPECT_TRUE(is_uninteresting(ConstraintCategory::OpaqueType));
    EXPECT_TRUE(is_uninteresting(ConstraintCategory::Boring));
    EXPECT_TRUE(is_uninteresting(ConstraintCategory::BoringNoLocation));
    EXPECT_TRUE(is_uninteresting(ConstraintCategory::Internal));
    EXPECT_FALSE(is_uninteresting(ConstraintCategory::Assignment));
    EXPECT_FALSE(is_uninteresting(ConstraintCategory::CopyBound));
}

TEST(ConstraintCategoryTest, FallbackOrderFollowsDeclaration) {
    EXPECT_LT(ConstraintCategory::Assignment, ConstraintCategory::Return);
    EXPECT_LT(ConstraintCategory::CallArgument, ConstraintCategory::TypeAnnotation);
    EXPECT_LT(ConstraintCategory::OpaqueType, ConstraintCategory::Boring);
    EXPECT_LT(ConstraintCategory::BoringNoLocation, ConstraintCategory::Internal);
}

TEST(RegionVidTest, PrintsWithQuestionMark) {
    std::ostringstream oss;
    oss << RegionVid(7) << " " << Location{2, 3};
    EXPECT_EQ(oss.str(), "'?7 bb2[3]");
}

// ============================================================================
// Edge Enumeration
// ============================================================================

class ConstraintGraphTest : public RegionFixture {};

TEST_F(ConstraintGraphTest, StoredEdgesInInsertionOrder) {
    auto a = add_region();
    auto b = add_region();
    auto c = add_region();
    outlives(a, c, ConstraintCategory::Cast);
    outlives(a, b, ConstraintCategory::Return);
    outlives(b, c);

    auto ctx = build();
    auto edges = ctx->outgoing_edges(a);
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(edges[0].sub, c);
    EXPECT_EQ(edges[0].category, ConstraintCategory::Cast);
    EXPECT_EQ(edges[1].sub, b);
    EXPECT_EQ(edges[1].category, ConstraintCategory::Return);

    EXPECT_TRUE(ctx->outgoing_edges(c).empty());
}

TEST_F(ConstraintGraphTest, StaticOutlivesEveryRegion) {
    auto a = add_region();
    auto b = add_region();
    // Stored edges out of 'static are subsumed by the implicit ones.
    outlives(static_r, b, ConstraintCategory::Assignment, span(1, 1, 2));

    auto ctx = build();
    auto edges = ctx->outgoing_edges(static_r);
    ASSERT_EQ(edges.size(), 3u);
    for (uint32_t i = 0; i < edges.size(); ++i) {
        EXPECT_EQ(edges[i].sup, static_r);
        EXPECT_EQ(edges[i].sub, RegionVid(i));
        EXPECT_EQ(edges[i].category, ConstraintCategory::Internal);
        EXPECT_EQ(edges[i].locations.kind, Locations::Kind::All);
        EXPECT_TRUE(edges[i].locations.span.is_dummy());
    }
    EXPECT_EQ(edges[1].sub, a);
    EXPECT_EQ(ctx->graph().stored_edges(static_r).size(), 1u);
}

// ============================================================================
// SCCs
// ============================================================================

TEST_F(ConstraintGraphTest, CycleFormsOneScc) {
    auto a = add_region();
    auto b = add_region();
    auto c = add_region();
    outlives(a, b);
    outlives(b, a);
    outlives(b, c);

    auto ctx = build();
    EXPECT_EQ(ctx->scc(a), ctx->scc(b));
    EXPECT_NE(ctx->scc(a), ctx->scc(c));
    EXPECT_NE(ctx->scc(c), ctx->scc(static_r));
    EXPECT_EQ(ctx->sccs().num_sccs(), 3u);
}

TEST_F(ConstraintGraphTest, RegionOutlivingStaticJoinsItsScc) {
    auto a = add_region();
    auto b = add_region();
    outlives(a, static_r);

    auto ctx = build();
    EXPECT_EQ(ctx->scc(a), ctx->scc(static_r));
    EXPECT_NE(ctx->scc(b), ctx->scc(static_r));

    auto members = ctx->sccs().members(ctx->scc(static_r));
    ASSERT_EQ(members.size(), 2u);
    EXPECT_EQ(members[0], static_r);
    EXPECT_EQ(members[1], a);
}

TEST_F(ConstraintGraphTest, SuppliedAssignmentIsRenumbered) {
    auto a = add_region();
    auto b = add_region();
    assign_sccs({7, 42, 42});

    auto ctx = build();
    EXPECT_EQ(ctx->scc(static_r), 0u);
    EXPECT_EQ(ctx->scc(a), 1u);
    EXPECT_EQ(ctx->scc(b), 1u);
    EXPECT_EQ(ctx->sccs().num_sccs(), 2u);
}

// ============================================================================
// Context Validation
// ============================================================================

TEST_F(ConstraintGraphTest, RejectsMissingStatic) {
    facts.definitions.clear();
    add_region();

    auto result = RegionInferenceContext::create(facts);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("no static region"), std::string::npos);
}

TEST_F(ConstraintGraphTest, RejectsTwoStatics) {
    add_region(RegionKind::Static);

    auto result = RegionInferenceContext::create(facts);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("both declared static"), std::string::npos);
}

TEST_F(ConstraintGraphTest, RejectsUnknownRegionInConstraint) {
    auto a = add_region();
    outlives(a, RegionVid(9));

    auto result = RegionInferenceContext::create(facts);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("unknown region"), std::string::npos);
}

TEST_F(ConstraintGraphTest, RejectsShortSccAssignment) {
    add_region();
    assign_sccs({0});

    EXPECT_TRUE(is_err(RegionInferenceContext::create(facts)));
}

// ============================================================================
// Region Classification and Spans
// ============================================================================

TEST_F(ConstraintGraphTest, ErrorRegionsOfUniversalRegions) {
    auto external = add_region(RegionKind::External, "'a");
    auto local = add_region(RegionKind::Local);
    auto existential = add_region();

    auto ctx = build();
    EXPECT_TRUE(ctx->to_error_region(static_r)->is_static());
    EXPECT_EQ(ctx->to_error_region(external)->name.value_or(""), "'a");
    EXPECT_EQ(ctx->to_error_region(external)->kind, ErrorRegion::Kind::EarlyBound);
    EXPECT_EQ(ctx->to_error_region(local)->kind, ErrorRegion::Kind::Free);
    EXPECT_FALSE(ctx->to_error_region(existential).has_value());

    EXPECT_TRUE(ctx->is_local_free_region(local));
    EXPECT_FALSE(ctx->is_local_free_region(external));
    EXPECT_FALSE(ctx->is_local_free_region(existential));
}

TEST_F(ConstraintGraphTest, SingleLocationsResolveThroughBody) {
    facts.body.span = span(1, 1, 40);
    facts.body.statement_spans[Location{0, 1}] = span(3, 5, 9);

    auto ctx = build();
    EXPECT_EQ(ctx->span_of(Locations::single(Location{0, 1})), span(3, 5, 9));
    EXPECT_EQ(ctx->span_of(Locations::single(Location{4, 0})), span(1, 1, 40));
    EXPECT_EQ(ctx->span_of(Locations::all(span(2, 2, 3))), span(2, 2, 3));
}
