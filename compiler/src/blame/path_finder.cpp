#include "blame/path_finder.hpp"

#include <algorithm>
#include <sstream>

namespace regionck::blame {

auto ConstraintPathFinder::reconstruct(const std::vector<Trace>& context, RegionVid found) const
    -> BlamePath {
    BlamePath path;
    path.target = found;

    RegionVid p = found;
    // Each step moves to the predecessor, so at most num_regions steps.
    for (size_t steps = 0; steps <= context.size(); ++steps) {
        const Trace& trace = context[p.index()];

        if (std::holds_alternative<StartRegion>(trace)) {
            std::reverse(path.constraints.begin(), path.constraints.end());
            return path;
        }

        if (const auto* constraint = std::get_if<OutlivesConstraint>(&trace)) {
            path.constraints.push_back(*constraint);
            p = constraint->sup;
            continue;
        }

        std::ostringstream oss;
        oss << "found unvisited region " << p << " on path to " << found;
        REGIONCK_LOG_FATAL("blame", oss.str());
        throw InternalCompilerError(oss.str());
    }

    std::ostringstream oss;
    oss << "predecessor chain from " << found << " does not reach the start region";
    REGIONCK_LOG_FATAL("blame", oss.str());
    throw InternalCompilerError(oss.str());
}

} // namespace regionck::blame
