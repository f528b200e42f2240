//! # Blame Selector
//!
//! Picks the one constraint that best explains why a region was required to
//! outlive another.
//!
//! ## Heuristic
//!
//! Given a path `'0: '1, '1: '2, ..., '5: '6` where `'6` is the target:
//!
//! 1. Some of the regions along the path are in the same SCC as `'6`. Edges
//!    leaving one of those add nothing, so they are skipped.
//! 2. Of the remaining edges, the one closest to the target is most likely
//!    the point where the value escapes. Bookkeeping categories (opaque
//!    types, boring and internal edges) are skipped as well.
//! 3. If nothing survives (e.g. the whole path lives in one SCC), the path
//!    is sorted by category and the first entry is taken.

#ifndef REGIONCK_BLAME_BLAME_SELECTOR_HPP
#define REGIONCK_BLAME_BLAME_SELECTOR_HPP

#include "blame/path_finder.hpp"

#include <sstream>
#include <utility>
#include <vector>

namespace regionck::blame {

using region::ConstraintCategory;
using region::Location;

/// The fact a diagnostic is built around.
struct SelectedBlame {
    ConstraintCategory category;
    SourceSpan span;
    RegionVid target;
};

/// A constraint reduced to what the selector ranks on.
using CategorizedConstraint = std::pair<ConstraintCategory, SourceSpan>;

class BlameSelector {
public:
    explicit BlameSelector(const region::RegionInferenceContext& ctx) : ctx_(ctx), finder_(ctx) {}

    /// Best constraint to blame for `R: from` where `R` satisfies
    /// `target_test`.
    ///
    /// The caller must know such an `R` is reachable; otherwise this throws
    /// `InternalCompilerError`.
    template <typename TargetTest>
    [[nodiscard]] auto best_blame(RegionVid from, TargetTest&& target_test) const
        -> SelectedBlame {
        REGIONCK_LOG_DEBUG("blame", "best_blame(from=" << from << ")");
        auto path = finder_.find_path(from, std::forward<TargetTest>(target_test));
        if (!path) {
            missing_path(from);
        }
        return select(*path);
    }

    /// Applies the heuristic to an already computed path.
    [[nodiscard]] auto select(const BlamePath& path) const -> SelectedBlame;

    /// `(category, span)` of every constraint on `path`, in path order.
    [[nodiscard]] auto categorize(const BlamePath& path) const -> std::vector<CategorizedConstraint>;

    /// Some region `R` with `fr1: R` that is live at `point`.
    [[nodiscard]] auto find_live_subregion(RegionVid fr1, Location point) const -> RegionVid;

    /// Span of the best constraint to blame for `fr1: fr2`.
    [[nodiscard]] auto find_blame_span(RegionVid fr1, RegionVid fr2) const -> SourceSpan;

    [[nodiscard]] auto path_finder() const -> const ConstraintPathFinder& {
        return finder_;
    }

private:
    [[noreturn]] void missing_path(RegionVid from) const;

    const region::RegionInferenceContext& ctx_;
    ConstraintPathFinder finder_;
};

} // namespace regionck::blame

#endif // REGIONCK_BLAME_BLAME_SELECTOR_HPP
