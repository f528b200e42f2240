#include "region/constraint_graph.hpp"

#include "log/log.hpp"

namespace regionck::region {

ConstraintGraph::ConstraintGraph(const ConstraintSet& constraints, size_t num_regions,
                                 RegionVid static_region)
    : constraints_(&constraints), static_region_(static_region), outgoing_(num_regions) {
    for (ConstraintIndex idx = 0; idx < constraints.size(); ++idx) {
        outgoing_[constraints[idx].sup.index()].push_back(idx);
    }
    REGIONCK_LOG_DEBUG("graph", "built constraint graph: " << num_regions << " regions, "
                                                           << constraints.size() << " edges");
}

auto ConstraintGraph::outgoing_edges(RegionVid r) const -> std::vector<OutlivesConstraint> {
    std::vector<OutlivesConstraint> edges;

    if (r == static_region_) {
        edges.reserve(outgoing_.size());
        for (uint32_t i = 0; i < outgoing_.size(); ++i) {
            edges.push_back(OutlivesConstraint{static_region_, RegionVid(i),
                                               Locations::all(SourceSpan{}),
                                               ConstraintCategory::Internal});
        }
        return edges;
    }

    const auto& stored = outgoing_[r.index()];
    edges.reserve(stored.size());
    for (ConstraintIndex idx : stored) {
        edges.push_back((*constraints_)[idx]);
    }
    return edges;
}

} // namespace regionck::region
