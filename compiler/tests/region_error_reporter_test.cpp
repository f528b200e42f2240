//! # Region Error Reporter Tests
//!
//! Shape dispatch (escaping data vs. general), label texts, region naming and
//! the specialized reporter's right of first refusal.

#include "region_fixture.hpp"
#include "report/region_error_reporter.hpp"

#include <gtest/gtest.h>

using namespace regionck::report;
using regionck::diag::DiagnosticBuffer;
using regionck::diag::SourceMap;

/// Records its arguments and optionally claims the error.
class RecordingNiceErrors : public NiceRegionErrors {
public:
    bool handle = false;
    int calls = 0;
    std::optional<ErrorRegion> seen_outlived;
    std::optional<ErrorRegion> seen_fr;
    SourceSpan seen_span;

    auto try_report(const SourceSpan& span, const ErrorRegion& outlived, const ErrorRegion& fr,
                    DiagnosticBuffer&) -> std::optional<ErrorReported> override {
        ++calls;
        seen_span = span;
        seen_outlived = outlived;
        seen_fr = fr;
        if (handle) {
            return ErrorReported{};
        }
        return std::nullopt;
    }
};

class RegionErrorReporterTest : public RegionFixture {
protected:
    TableItemContext items;
    SourceMap source_map;
    RecordingNiceErrors nice;
    DiagnosticBuffer buffer;

    Box<RegionInferenceContext> ctx;
    std::unique_ptr<ContextRegionNamer> namer;
    std::unique_ptr<RegionErrorReporter> reporter;

    void set_body(ItemKind kind) {
        facts.body.kind = kind;
        facts.body.name = kind == ItemKind::Closure ? "main::{closure#0}" : "main";
        facts.body.span = span(1, 1, 60);
        items.add_item(facts.body.item, kind);
    }

    auto report(RegionVid fr, RegionVid outlived) -> ReportShape {
        ctx = build();
        namer = std::make_unique<ContextRegionNamer>(*ctx);
        reporter = std::make_unique<RegionErrorReporter>(*ctx, items, *namer, nice, source_map);
        return reporter->report_error(fr, outlived, buffer);
    }

    auto only_diagnostic() -> const regionck::diag::Diagnostic& {
        EXPECT_EQ(buffer.size(), 1u);
        return buffer[0];
    }
};

// ============================================================================
// Escaping Data
// ============================================================================

TEST_F(RegionErrorReporterTest, ArgumentEscapingClosure) {
    set_body(ItemKind::Closure);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::Local);
    set_var(outlived, "f", span(2, 13, 18));
    set_var(fr, "x", span(3, 30, 31));
    outlives(fr, outlived, ConstraintCategory::CallArgument, span(4, 9, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::EscapingData);

    const auto& diag = only_diagnostic();
    EXPECT_EQ(diag.message, "borrowed data escapes outside of closure");
    EXPECT_EQ(diag.code, "R0002");
    EXPECT_EQ(diag.primary_span, span(4, 9, 20));
    ASSERT_EQ(diag.labels.size(), 3u);

    const auto* declared = diag.find_label("`f` is declared here, outside of the closure body");
    ASSERT_NE(declared, nullptr);
    EXPECT_EQ(declared->span, span(2, 13, 18));
    EXPECT_FALSE(declared->is_primary);

    const auto* valid = diag.find_label("`x` is a reference that is only valid in the closure body");
    ASSERT_NE(valid, nullptr);
    EXPECT_EQ(valid->span, span(3, 30, 31));

    const auto* escapes = diag.find_label("`x` escapes the closure body here");
    ASSERT_NE(escapes, nullptr);
    EXPECT_EQ(escapes->span, span(4, 9, 20));
    EXPECT_TRUE(escapes->is_primary);
}

TEST_F(RegionErrorReporterTest, AssignmentEscapingClosure) {
    set_body(ItemKind::Closure);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::Local);
    set_var(outlived, "f", span(2, 13, 18));
    set_var(fr, "x", span(3, 30, 31));
    outlives(fr, outlived, ConstraintCategory::Assignment, span(4, 9, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::EscapingData);
    EXPECT_NE(only_diagnostic().find_label("`x` escapes the closure body here"), nullptr);
}

TEST_F(RegionErrorReporterTest, ArgumentEscapingFunction) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::Local);
    set_var(outlived, "sink", span(1, 8, 12));
    set_var(fr, "data", span(1, 20, 24));
    outlives(fr, outlived, ConstraintCategory::CallArgument, span(2, 5, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::EscapingData);
    const auto& diag = only_diagnostic();
    EXPECT_EQ(diag.message, "borrowed data escapes outside of function");
    EXPECT_NE(diag.find_label("`sink` is declared here, outside of the function body"), nullptr);
    EXPECT_NE(diag.find_label("`data` escapes the function body here"), nullptr);
}

TEST_F(RegionErrorReporterTest, OnlyNamedRegionsGetLabels) {
    set_body(ItemKind::Closure);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::Local);
    set_var(outlived, "f", span(2, 13, 18));
    // An anonymous binding still counts as resolved.
    set_var(fr, std::nullopt, span(3, 30, 31));
    outlives(fr, outlived, ConstraintCategory::CallArgument, span(4, 9, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::EscapingData);
    const auto& diag = only_diagnostic();
    ASSERT_EQ(diag.labels.size(), 1u);
    EXPECT_EQ(diag.labels[0].message, "`f` is declared here, outside of the closure body");
}

// ============================================================================
// Reverting to the General Shape
// ============================================================================

TEST_F(RegionErrorReporterTest, AssignmentInFunctionIsNotAnEscape) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::Local);
    set_var(outlived, "f", span(2, 13, 18));
    set_var(fr, "x", span(3, 30, 31));
    outlives(fr, outlived, ConstraintCategory::Assignment, span(4, 9, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::General);

    const auto& diag = only_diagnostic();
    EXPECT_EQ(diag.message, "unsatisfied lifetime constraints");
    EXPECT_EQ(diag.code, "R0001");
    EXPECT_EQ(diag.find_label("escapes"), nullptr);
    const auto* label = diag.find_label("assignment requires that `'1` must outlive `'2`");
    ASSERT_NE(label, nullptr);
    EXPECT_TRUE(label->is_primary);
}

TEST_F(RegionErrorReporterTest, UnresolvedVariablesRevertToGeneral) {
    set_body(ItemKind::Closure);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::Local);
    outlives(fr, outlived, ConstraintCategory::CallArgument, span(4, 9, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::General);
    EXPECT_NE(only_diagnostic().find_label("argument requires that `'1` must outlive `'2`"),
              nullptr);
}

TEST_F(RegionErrorReporterTest, NonLocalRegionsUseGeneralShape) {
    set_body(ItemKind::Closure);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::External, "'a");
    set_var(fr, "x", span(3, 30, 31));
    outlives(fr, outlived, ConstraintCategory::CallArgument, span(4, 9, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::General);
    EXPECT_NE(only_diagnostic().find_label("argument requires that `'a` must outlive `'b`"),
              nullptr);
}

// ============================================================================
// General Shape
// ============================================================================

TEST_F(RegionErrorReporterTest, SynthesizedNamesLabelTheirReferences) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::External);
    set_var(fr, "x", span(1, 10, 14));
    set_var(outlived, "y", span(1, 20, 24));
    outlives(fr, outlived, ConstraintCategory::Cast, span(2, 5, 12));

    report(fr, outlived);

    const auto& diag = only_diagnostic();
    const auto* first = diag.find_label("let's call the lifetime of this reference `'1`");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->span, span(1, 10, 14));
    const auto* second = diag.find_label("let's call the lifetime of this reference `'2`");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->span, span(1, 20, 24));
    EXPECT_NE(diag.find_label("cast requires that `'1` must outlive `'2`"), nullptr);
}

TEST_F(RegionErrorReporterTest, NamedRegionsDoNotConsumeTheCounter) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External);
    auto fr = add_region(RegionKind::External, "'a");
    outlives(fr, outlived, ConstraintCategory::TypeAnnotation, span(2, 5, 12));

    report(fr, outlived);
    EXPECT_NE(only_diagnostic().find_label("type annotation requires that `'a` must outlive `'1`"),
              nullptr);
}

TEST_F(RegionErrorReporterTest, ReturnIntoLocalRegion) {
    set_body(ItemKind::Closure);
    auto outlived = add_region(RegionKind::Local);
    auto fr = add_region(RegionKind::External, "'a");
    outlives(fr, outlived, ConstraintCategory::Return, span(5, 9, 10));

    EXPECT_EQ(report(fr, outlived), ReportShape::General);
    EXPECT_NE(only_diagnostic().find_label(
                  "closure was supposed to return data with lifetime `'1` but it is returning "
                  "data with lifetime `'a`"),
              nullptr);
}

TEST_F(RegionErrorReporterTest, ReturnIntoExternalRegion) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::External, "'a");
    outlives(fr, outlived, ConstraintCategory::Return, span(5, 9, 10));

    report(fr, outlived);
    EXPECT_NE(only_diagnostic().find_label("returning this value requires that `'a` must outlive "
                                           "`'b`"),
              nullptr);
}

TEST_F(RegionErrorReporterTest, BoringBlameHasNoPhrase) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::External, "'a");
    outlives(fr, outlived, ConstraintCategory::Boring, span(5, 9, 10));

    report(fr, outlived);
    EXPECT_EQ(only_diagnostic().labels.at(0).message, "requires that `'a` must outlive `'b`");
}

TEST_F(RegionErrorReporterTest, RequirementOnStatic) {
    set_body(ItemKind::Function);
    auto fr = add_region(RegionKind::External, "'a");
    outlives(fr, static_r, ConstraintCategory::Return, span(3, 5, 6));

    report(fr, static_r);
    EXPECT_NE(only_diagnostic().find_label(
                  "returning this value requires that `'a` must outlive `'static`"),
              nullptr);
}

TEST_F(RegionErrorReporterTest, BlameFollowsIntermediateRegions) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::External, "'a");
    auto tmp = add_region();
    outlives(fr, tmp, ConstraintCategory::CallArgument, span(2, 5, 9));
    outlives(tmp, outlived, ConstraintCategory::Boring, span(3, 5, 9));

    report(fr, outlived);
    EXPECT_EQ(only_diagnostic().primary_span, span(2, 5, 9));
}

TEST_F(RegionErrorReporterTest, MissingPathIsAnInternalError) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::External, "'a");

    EXPECT_THROW(report(fr, outlived), InternalCompilerError);
    EXPECT_TRUE(buffer.empty());
}

// ============================================================================
// Specialized Reporter
// ============================================================================

TEST_F(RegionErrorReporterTest, SpecializedReporterPreemptsEverything) {
    set_body(ItemKind::Closure);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::Local, "'a");
    set_var(fr, "x", span(3, 30, 31));
    set_var(outlived, "f", span(2, 13, 18));
    outlives(fr, outlived, ConstraintCategory::CallArgument, span(4, 9, 20));
    nice.handle = true;

    EXPECT_EQ(report(fr, outlived), ReportShape::Specialized);
    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(nice.calls, 1);
    EXPECT_EQ(nice.seen_span, span(4, 9, 20));
    ASSERT_TRUE(nice.seen_outlived.has_value());
    EXPECT_EQ(nice.seen_outlived->name.value_or(""), "'b");
    EXPECT_EQ(nice.seen_fr->name.value_or(""), "'a");
}

TEST_F(RegionErrorReporterTest, SpecializedReporterDeclining) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::External, "'a");
    outlives(fr, outlived, ConstraintCategory::Assignment, span(4, 9, 20));

    EXPECT_EQ(report(fr, outlived), ReportShape::General);
    EXPECT_EQ(nice.calls, 1);
    EXPECT_EQ(buffer.size(), 1u);
}

TEST_F(RegionErrorReporterTest, SpecializedReporterNeedsExternalNames) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region();
    outlives(fr, outlived, ConstraintCategory::Assignment, span(4, 9, 20));
    nice.handle = true;

    EXPECT_EQ(report(fr, outlived), ReportShape::General);
    EXPECT_EQ(nice.calls, 0);
    EXPECT_EQ(buffer.size(), 1u);
}

TEST_F(RegionErrorReporterTest, OneDiagnosticPerViolation) {
    set_body(ItemKind::Function);
    auto outlived = add_region(RegionKind::External, "'b");
    auto fr = add_region(RegionKind::External, "'a");
    outlives(fr, outlived, ConstraintCategory::Assignment, span(4, 9, 20));
    outlives(fr, static_r, ConstraintCategory::Cast, span(5, 9, 20));

    report(fr, outlived);
    reporter->report_error(fr, static_r, buffer);

    ASSERT_EQ(buffer.size(), 2u);
    EXPECT_EQ(buffer[0].primary_span, span(4, 9, 20));
    EXPECT_EQ(buffer[1].primary_span, span(5, 9, 20));
}
