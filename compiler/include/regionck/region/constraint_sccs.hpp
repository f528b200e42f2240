//! # Constraint SCCs
//!
//! Partition of the regions into strongly connected components of the
//! constraint graph. Two regions in the same component outlive each other,
//! so the inference engine treats them as one equivalence group.
//!
//! The partition is either computed here (Tarjan, iterative) or taken as-is
//! from the solver.

#ifndef REGIONCK_REGION_CONSTRAINT_SCCS_HPP
#define REGIONCK_REGION_CONSTRAINT_SCCS_HPP

#include "region/constraint_graph.hpp"

#include <optional>
#include <string>
#include <vector>

namespace regionck::region {

/// Dense identifier of an equivalence group.
using SccId = uint32_t;

class ConstraintSccs {
public:
    /// Computes the components of `graph`, implicit `'static` edges included.
    /// Component ids are assigned in the order Tarjan completes them.
    [[nodiscard]] static auto compute(const ConstraintGraph& graph) -> ConstraintSccs;

    /// Uses a partition supplied by the solver. `assignment[i]` is the group
    /// of region `i`. Group ids are renumbered densely in first-seen order.
    [[nodiscard]] static auto from_assignment(const std::vector<SccId>& assignment)
        -> ConstraintSccs;

    [[nodiscard]] auto scc(RegionVid r) const -> SccId {
        return scc_of_[r.index()];
    }

    [[nodiscard]] auto num_sccs() const -> size_t {
        return num_sccs_;
    }

    [[nodiscard]] auto num_regions() const -> size_t {
        return scc_of_.size();
    }

    /// Regions in the group, in index order.
    [[nodiscard]] auto members(SccId scc) const -> std::vector<RegionVid>;

private:
    std::vector<SccId> scc_of_;
    size_t num_sccs_ = 0;
};

} // namespace regionck::region

#endif // REGIONCK_REGION_CONSTRAINT_SCCS_HPP
