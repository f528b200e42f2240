#include "region/constraint_sccs.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <limits>
#include <unordered_map>

namespace regionck::region {

namespace {

constexpr uint32_t UNVISITED = std::numeric_limits<uint32_t>::max();

/// One pending call of the recursive formulation.
struct Frame {
    uint32_t region;
    std::vector<OutlivesConstraint> edges;
    size_t next_edge = 0;
};

} // namespace

auto ConstraintSccs::compute(const ConstraintGraph& graph) -> ConstraintSccs {
    const size_t n = graph.num_regions();

    ConstraintSccs result;
    result.scc_of_.assign(n, 0);

    std::vector<uint32_t> dfs_index(n, UNVISITED);
    std::vector<uint32_t> low_link(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<uint32_t> stack;
    std::vector<Frame> frames;
    uint32_t next_index = 0;

    auto enter = [&](uint32_t v) {
        dfs_index[v] = next_index;
        low_link[v] = next_index;
        ++next_index;
        stack.push_back(v);
        on_stack[v] = true;
        frames.push_back(Frame{v, graph.outgoing_edges(RegionVid(v)), 0});
    };

    for (uint32_t root = 0; root < n; ++root) {
        if (dfs_index[root] != UNVISITED)
            continue;

        enter(root);
        while (!frames.empty()) {
            Frame& frame = frames.back();
            uint32_t v = frame.region;

            if (frame.next_edge < frame.edges.size()) {
                uint32_t w = frame.edges[frame.next_edge++].sub.index();
                if (dfs_index[w] == UNVISITED) {
                    enter(w); // invalidates `frame`
                } else if (on_stack[w]) {
                    low_link[v] = std::min(low_link[v], dfs_index[w]);
                }
                continue;
            }

            if (low_link[v] == dfs_index[v]) {
                auto scc = static_cast<SccId>(result.num_sccs_++);
                uint32_t member;
                do {
                    member = stack.back();
                    stack.pop_back();
                    on_stack[member] = false;
                    result.scc_of_[member] = scc;
                } while (member != v);
            }

            frames.pop_back();
            if (!frames.empty()) {
                uint32_t parent = frames.back().region;
                low_link[parent] = std::min(low_link[parent], low_link[v]);
            }
        }
    }

    REGIONCK_LOG_DEBUG("graph", "computed " << result.num_sccs_ << " SCCs over " << n
                                            << " regions");
    return result;
}

auto ConstraintSccs::from_assignment(const std::vector<SccId>& assignment) -> ConstraintSccs {
    ConstraintSccs result;
    result.scc_of_.reserve(assignment.size());

    std::unordered_map<SccId, SccId> renumbered;
    for (SccId group : assignment) {
        auto it = renumbered.try_emplace(group, static_cast<SccId>(renumbered.size())).first;
        result.scc_of_.push_back(it->second);
    }
    result.num_sccs_ = renumbered.size();
    return result;
}

auto ConstraintSccs::members(SccId scc) const -> std::vector<RegionVid> {
    std::vector<RegionVid> regions;
    for (uint32_t i = 0; i < scc_of_.size(); ++i) {
        if (scc_of_[i] == scc) {
            regions.push_back(RegionVid(i));
        }
    }
    return regions;
}

} // namespace regionck::region
