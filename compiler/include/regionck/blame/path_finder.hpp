//! # Constraint Path Finder
//!
//! Breadth-first search over the constraint graph (`'a: 'b` is the edge
//! `'a -> 'b`) from a start region to the first region accepted by a target
//! test, returning the constraints along the way.
//!
//! ## Why BFS
//!
//! The search stops at the first region dequeued that passes the test, so the
//! returned path has the fewest constraints of any path to a matching region.
//! Among paths of equal length the one found first in edge enumeration order
//! wins; nothing is re-ranked here.

#ifndef REGIONCK_BLAME_PATH_FINDER_HPP
#define REGIONCK_BLAME_PATH_FINDER_HPP

#include "log/log.hpp"
#include "region/region_context.hpp"

#include <deque>
#include <optional>
#include <variant>
#include <vector>

namespace regionck::blame {

using region::OutlivesConstraint;
using region::RegionVid;

/// A chain of constraints forcing `target` to be outlived by the start region.
struct BlamePath {
    /// Constraints in order from the start region to `target`.
    std::vector<OutlivesConstraint> constraints;

    /// The region that passed the target test.
    RegionVid target;
};

/// Per-region search state.
struct NotVisited {};
struct StartRegion {};
using Trace = std::variant<NotVisited, StartRegion, OutlivesConstraint>;

class ConstraintPathFinder {
public:
    explicit ConstraintPathFinder(const region::RegionInferenceContext& ctx) : ctx_(ctx) {}

    /// Shortest constraint path from `from` to a region satisfying
    /// `target_test`, or nullopt if no such region is reachable.
    ///
    /// `target_test` is any callable `RegionVid -> bool`.
    template <typename TargetTest>
    [[nodiscard]] auto find_path(RegionVid from, TargetTest&& target_test) const
        -> std::optional<BlamePath> {
        std::vector<Trace> context(ctx_.num_regions(), NotVisited{});
        context[from.index()] = StartRegion{};

        std::deque<RegionVid> queue;
        queue.push_back(from);

        while (!queue.empty()) {
            RegionVid r = queue.front();
            queue.pop_front();

            if (target_test(r)) {
                return reconstruct(context, r);
            }

            for (const auto& constraint : ctx_.outgoing_edges(r)) {
                RegionVid sub = constraint.sub;
                if (std::holds_alternative<NotVisited>(context[sub.index()])) {
                    REGIONCK_LOG_TRACE("blame", "reached " << sub << " via " << constraint);
                    context[sub.index()] = constraint;
                    queue.push_back(sub);
                }
            }
        }

        REGIONCK_LOG_DEBUG("blame", "no region reachable from " << from << " passes the test");
        return std::nullopt;
    }

private:
    /// Walks the trace back from `found` to the start region.
    ///
    /// Throws `InternalCompilerError` if an unvisited region is on the way.
    [[nodiscard]] auto reconstruct(const std::vector<Trace>& context, RegionVid found) const
        -> BlamePath;

    const region::RegionInferenceContext& ctx_;
};

} // namespace regionck::blame

#endif // REGIONCK_BLAME_PATH_FINDER_HPP
