//! # Region Test Fixture
//!
//! Builds small inference contexts by hand. Region 0 is always `'static`.

#ifndef REGIONCK_TESTS_REGION_FIXTURE_HPP
#define REGIONCK_TESTS_REGION_FIXTURE_HPP

#include "region/region_context.hpp"

#include <gtest/gtest.h>
#include <optional>
#include <string>

using namespace regionck;
using namespace regionck::region;

class RegionFixture : public ::testing::Test {
protected:
    static constexpr std::string_view FILE_NAME = "test.rs";

    RegionFacts facts;
    RegionVid static_r;

    void SetUp() override {
        static_r = add_region(RegionKind::Static);
    }

    auto add_region(RegionKind kind = RegionKind::Existential,
                    std::optional<std::string> name = std::nullopt) -> RegionVid {
        RegionDefinition def;
        def.kind = kind;
        def.user_name = name;
        if (kind == RegionKind::Static) {
            def.external_name = ErrorRegion::static_region();
        } else if (kind != RegionKind::Existential) {
            auto region_kind = name ? ErrorRegion::Kind::EarlyBound : ErrorRegion::Kind::Free;
            def.external_name = ErrorRegion{region_kind, name, facts.body.item};
        }
        facts.definitions.push_back(std::move(def));
        return RegionVid(static_cast<uint32_t>(facts.definitions.size() - 1));
    }

    void set_var(RegionVid r, std::optional<std::string> name, SourceSpan span) {
        facts.definitions[r.index()].var_name = std::move(name);
        facts.definitions[r.index()].var_span = span;
    }

    static auto span(uint32_t line, uint32_t col, uint32_t end_col) -> SourceSpan {
        return SourceSpan{{FILE_NAME, line, col}, {FILE_NAME, line, end_col}};
    }

    auto outlives(RegionVid sup, RegionVid sub,
                  ConstraintCategory category = ConstraintCategory::Assignment,
                  SourceSpan where = {}) -> ConstraintIndex {
        return facts.constraints.push(
            OutlivesConstraint{sup, sub, Locations::all(where), category});
    }

    auto outlives_at(RegionVid sup, RegionVid sub, ConstraintCategory category, Location loc)
        -> ConstraintIndex {
        return facts.constraints.push(
            OutlivesConstraint{sup, sub, Locations::single(loc), category});
    }

    void live(RegionVid r, Location point) {
        facts.liveness.resize(facts.definitions.size());
        facts.liveness.add(r, point);
    }

    /// Replaces the computed SCC partition.
    void assign_sccs(std::vector<SccId> assignment) {
        facts.scc_assignment = std::move(assignment);
    }

    auto build() -> Box<RegionInferenceContext> {
        auto result = RegionInferenceContext::create(facts);
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result) : std::string());
        return std::move(unwrap(result));
    }
};

#endif // REGIONCK_TESTS_REGION_FIXTURE_HPP
