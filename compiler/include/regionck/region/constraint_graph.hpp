//! # Constraint Graph
//!
//! Forward adjacency over a `ConstraintSet`: for a region `r`, the
//! constraints `r: X` in generation order.
//!
//! ## The `'static` Region
//!
//! `'static` outlives every region, but the inference engine never records
//! those constraints explicitly. Instead, enumerating the outgoing edges of
//! the static region yields one implicit `'static: r` edge for every region
//! `r` (category `Internal`, no location). Stored edges whose `sup` is
//! `'static` are subsumed by these and not yielded separately.

#ifndef REGIONCK_REGION_CONSTRAINT_GRAPH_HPP
#define REGIONCK_REGION_CONSTRAINT_GRAPH_HPP

#include "region/constraint.hpp"

#include <vector>

namespace regionck::region {

class ConstraintGraph {
public:
    /// Builds the adjacency lists. Every endpoint must be below `num_regions`.
    ConstraintGraph(const ConstraintSet& constraints, size_t num_regions, RegionVid static_region);

    /// Constraints `r: X`, including the implicit edges when `r` is `'static`.
    [[nodiscard]] auto outgoing_edges(RegionVid r) const -> std::vector<OutlivesConstraint>;

    /// Indices of the stored constraints `r: X`.
    [[nodiscard]] auto stored_edges(RegionVid r) const -> const std::vector<ConstraintIndex>& {
        return outgoing_[r.index()];
    }

    [[nodiscard]] auto num_regions() const -> size_t {
        return outgoing_.size();
    }

    [[nodiscard]] auto static_region() const -> RegionVid {
        return static_region_;
    }

private:
    const ConstraintSet* constraints_;
    RegionVid static_region_;
    std::vector<std::vector<ConstraintIndex>> outgoing_;
};

} // namespace regionck::region

#endif // REGIONCK_REGION_CONSTRAINT_GRAPH_HPP
