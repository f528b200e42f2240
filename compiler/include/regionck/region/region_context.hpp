//! # Region Inference Context
//!
//! Read-only view of everything the inference engine knows once it has
//! finished solving a body and detected a violated constraint:
//!
//! - the region definitions and the classification of universal regions,
//! - the outlives constraints and their graph,
//! - the SCC partition,
//! - liveness of regions at program points,
//! - the span table of the body being checked.
//!
//! This is the query surface the blame search and the reporter run against.
//! Nothing here is mutated after `create()` returns.

#ifndef REGIONCK_REGION_REGION_CONTEXT_HPP
#define REGIONCK_REGION_REGION_CONTEXT_HPP

#include "common.hpp"
#include "region/constraint.hpp"
#include "region/constraint_graph.hpp"
#include "region/constraint_sccs.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace regionck::region {

/// Identifier of an item (function or closure) known to the item context.
using ItemId = uint32_t;

/// Whether a body belongs to a plain function or to a closure.
enum class ItemKind {
    Function,
    Closure,
};

/// A region as the type system would name it outside of inference.
struct ErrorRegion {
    enum class Kind {
        Static,     ///< `'static`
        EarlyBound, ///< A named lifetime parameter of an item
        Free,       ///< A region bound in an item's signature, possibly anonymous
    };

    Kind kind = Kind::Free;

    /// User-written name, e.g. `'a`. Anonymous free regions have none.
    std::optional<std::string> name;

    /// Item whose signature binds the region. Empty for `'static`.
    std::optional<ItemId> scope;

    [[nodiscard]] auto is_static() const -> bool {
        return kind == Kind::Static;
    }

    [[nodiscard]] static auto static_region() -> ErrorRegion {
        return ErrorRegion{Kind::Static, std::string("'static"), std::nullopt};
    }

    [[nodiscard]] auto operator==(const ErrorRegion& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const ErrorRegion& region) -> std::ostream&;

/// Where a region comes from.
///
/// `Static`, `External` and `Local` are universal regions: they are not
/// inferred but supplied by the signature. `External` regions are provided by
/// the caller; `Local` ones are scoped to the body being checked (for example
/// the regions of a closure's own signature).
enum class RegionKind {
    Static,
    External,
    Local,
    Existential,
};

/// Everything known about one region variable.
struct RegionDefinition {
    RegionKind kind = RegionKind::Existential;

    /// External name for universal regions (ignored for `Static`, which
    /// always maps to `'static`).
    std::optional<ErrorRegion> external_name;

    /// User-written lifetime name, e.g. `'a`.
    std::optional<std::string> user_name;

    /// Argument or captured variable whose type mentions this region.
    std::optional<std::string> var_name;

    /// Declaration span of `var_name`.
    std::optional<SourceSpan> var_span;

    [[nodiscard]] auto is_universal() const -> bool {
        return kind != RegionKind::Existential;
    }
};

/// Set of points at which each region is live.
class LivenessValues {
public:
    explicit LivenessValues(size_t num_regions = 0) : points_(num_regions) {}

    void resize(size_t num_regions) {
        points_.resize(num_regions);
    }

    void add(RegionVid r, Location point) {
        points_[r.index()].insert(point);
    }

    [[nodiscard]] auto contains(RegionVid r, Location point) const -> bool {
        return r.index() < points_.size() && points_[r.index()].count(point) > 0;
    }

    [[nodiscard]] auto num_regions() const -> size_t {
        return points_.size();
    }

private:
    std::vector<std::set<Location>> points_;
};

/// The body whose constraints are being explained.
struct BodyInfo {
    ItemId item = 0;
    ItemKind kind = ItemKind::Function;
    std::string name;

    /// Span of the whole body; used when a statement has no recorded span.
    SourceSpan span;

    /// Span of each statement that has one.
    std::map<Location, SourceSpan> statement_spans;

    [[nodiscard]] auto source_span(Location loc) const -> SourceSpan {
        auto it = statement_spans.find(loc);
        return it != statement_spans.end() ? it->second : span;
    }
};

/// Raw solver output, consumed by `RegionInferenceContext::create`.
struct RegionFacts {
    std::vector<RegionDefinition> definitions;
    ConstraintSet constraints;
    LivenessValues liveness;
    BodyInfo body;

    /// Precomputed SCC partition; computed from the graph when empty.
    std::optional<std::vector<SccId>> scc_assignment;
};

class RegionInferenceContext {
private:
    /// Tag type restricting construction to create().
    struct CreateTag {};

public:
    /// Validates `facts` and builds the graph and SCCs.
    ///
    /// Fails when there is not exactly one static region, when a constraint
    /// or SCC assignment mentions an unknown region, or when liveness was
    /// sized for a different number of regions.
    [[nodiscard]] static auto create(RegionFacts facts)
        -> Result<Box<RegionInferenceContext>, std::string>;

    RegionInferenceContext(CreateTag, RegionFacts facts, RegionVid static_region);

    RegionInferenceContext(const RegionInferenceContext&) = delete;
    RegionInferenceContext& operator=(const RegionInferenceContext&) = delete;

    [[nodiscard]] auto num_regions() const -> size_t {
        return definitions_.size();
    }

    [[nodiscard]] auto static_region() const -> RegionVid {
        return static_region_;
    }

    [[nodiscard]] auto definition(RegionVid r) const -> const RegionDefinition& {
        return definitions_[r.index()];
    }

    [[nodiscard]] auto constraints() const -> const ConstraintSet& {
        return constraints_;
    }

    [[nodiscard]] auto graph() const -> const ConstraintGraph& {
        return *graph_;
    }

    [[nodiscard]] auto sccs() const -> const ConstraintSccs& {
        return sccs_;
    }

    [[nodiscard]] auto body() const -> const BodyInfo& {
        return body_;
    }

    /// Constraints `r: X`, implicit `'static` edges included.
    [[nodiscard]] auto outgoing_edges(RegionVid r) const -> std::vector<OutlivesConstraint> {
        return graph_->outgoing_edges(r);
    }

    [[nodiscard]] auto scc(RegionVid r) const -> SccId {
        return sccs_.scc(r);
    }

    [[nodiscard]] auto liveness_contains(RegionVid r, Location point) const -> bool {
        return liveness_.contains(r, point);
    }

    /// Whether `r` is a universal region scoped to the current body.
    [[nodiscard]] auto is_local_free_region(RegionVid r) const -> bool {
        return definitions_[r.index()].kind == RegionKind::Local;
    }

    /// The external name of `r`, if it has one. Only universal regions do.
    [[nodiscard]] auto to_error_region(RegionVid r) const -> std::optional<ErrorRegion>;

    /// Span a constraint is reported at.
    [[nodiscard]] auto span_of(const Locations& locations) const -> SourceSpan;

private:
    std::vector<RegionDefinition> definitions_;
    ConstraintSet constraints_;
    LivenessValues liveness_;
    BodyInfo body_;
    RegionVid static_region_;
    Box<ConstraintGraph> graph_;
    ConstraintSccs sccs_;
};

} // namespace regionck::region

#endif // REGIONCK_REGION_REGION_CONTEXT_HPP
