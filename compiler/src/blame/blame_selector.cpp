#include "blame/blame_selector.hpp"

#include "common.hpp"

#include <algorithm>

namespace regionck::blame {

void BlameSelector::missing_path(RegionVid from) const {
    std::ostringstream oss;
    oss << "no constraint path from " << from << " to a region satisfying the target test";
    REGIONCK_LOG_FATAL("blame", oss.str());
    throw InternalCompilerError(oss.str());
}

auto BlameSelector::categorize(const BlamePath& path) const -> std::vector<CategorizedConstraint> {
    std::vector<CategorizedConstraint> categorized;
    categorized.reserve(path.constraints.size());
    for (const auto& constraint : path.constraints) {
        categorized.emplace_back(constraint.category, ctx_.span_of(constraint.locations));
    }
    return categorized;
}

auto BlameSelector::select(const BlamePath& path) const -> SelectedBlame {
    auto categorized = categorize(path);

    if (log::Logger::instance().should_log(log::LogLevel::Debug, "blame")) {
        std::ostringstream oss;
        for (const auto& c : path.constraints) {
            oss << "\n    " << c << " (" << ctx_.scc(c.sup) << ": " << ctx_.scc(c.sub) << ")";
        }
        REGIONCK_LOG_DEBUG("blame", "path to " << path.target << ":" << oss.str());
    }

    const auto target_scc = ctx_.scc(path.target);
    for (size_t i = path.constraints.size(); i-- > 0;) {
        const auto& constraint = path.constraints[i];
        if (region::is_uninteresting(categorized[i].first))
            continue;
        if (ctx_.scc(constraint.sup) == target_scc)
            continue;

        REGIONCK_LOG_DEBUG("blame", "blaming " << constraint << " at " << categorized[i].second);
        return SelectedBlame{categorized[i].first, categorized[i].second, path.target};
    }

    // Everything is unified with the target or uninteresting. Fall back to the
    // highest-ranked category.
    if (categorized.empty()) {
        REGIONCK_LOG_DEBUG("blame", "empty path, blaming the body of " << ctx_.body().name);
        return SelectedBlame{ConstraintCategory::Internal, ctx_.body().span, path.target};
    }

    std::stable_sort(categorized.begin(), categorized.end(),
                     [](const CategorizedConstraint& a, const CategorizedConstraint& b) {
                         return a.first < b.first;
                     });
    REGIONCK_LOG_DEBUG("blame", "fallback: blaming " << categorized.front().first << " at "
                                                     << categorized.front().second);
    return SelectedBlame{categorized.front().first, categorized.front().second, path.target};
}

auto BlameSelector::find_live_subregion(RegionVid fr1, Location point) const -> RegionVid {
    auto path =
        finder_.find_path(fr1, [this, point](RegionVid r) { return ctx_.liveness_contains(r, point); });
    if (!path) {
        missing_path(fr1);
    }
    return path->target;
}

auto BlameSelector::find_blame_span(RegionVid fr1, RegionVid fr2) const -> SourceSpan {
    return best_blame(fr1, [fr2](RegionVid r) { return r == fr2; }).span;
}

} // namespace regionck::blame
