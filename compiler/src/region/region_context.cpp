#include "region/region_context.hpp"

#include "log/log.hpp"

#include <sstream>

namespace regionck::region {

auto operator<<(std::ostream& os, const ErrorRegion& region) -> std::ostream& {
    switch (region.kind) {
    case ErrorRegion::Kind::Static:
        return os << "'static";
    case ErrorRegion::Kind::EarlyBound:
        return os << "early-bound " << region.name.value_or("'_");
    case ErrorRegion::Kind::Free:
        return os << "free " << region.name.value_or("'_");
    }
    return os;
}

auto RegionInferenceContext::create(RegionFacts facts)
    -> Result<Box<RegionInferenceContext>, std::string> {
    const size_t n = facts.definitions.size();

    std::optional<RegionVid> static_region;
    for (uint32_t i = 0; i < n; ++i) {
        if (facts.definitions[i].kind != RegionKind::Static)
            continue;
        if (static_region) {
            std::ostringstream oss;
            oss << "regions " << *static_region << " and " << RegionVid(i)
                << " are both declared static";
            return oss.str();
        }
        static_region = RegionVid(i);
    }
    if (!static_region) {
        return std::string("no static region declared");
    }

    for (const auto& c : facts.constraints) {
        if (c.sup.index() >= n || c.sub.index() >= n) {
            std::ostringstream oss;
            oss << "constraint " << c << " mentions an unknown region";
            return oss.str();
        }
    }

    if (facts.scc_assignment && facts.scc_assignment->size() != n) {
        std::ostringstream oss;
        oss << "SCC assignment covers " << facts.scc_assignment->size() << " regions, expected "
            << n;
        return oss.str();
    }

    if (facts.liveness.num_regions() > n) {
        std::ostringstream oss;
        oss << "liveness recorded for " << facts.liveness.num_regions() << " regions, expected "
            << n;
        return oss.str();
    }
    facts.liveness.resize(n);

    return make_box<RegionInferenceContext>(CreateTag{}, std::move(facts), *static_region);
}

RegionInferenceContext::RegionInferenceContext(CreateTag, RegionFacts facts,
                                               RegionVid static_region)
    : definitions_(std::move(facts.definitions)), constraints_(std::move(facts.constraints)),
      liveness_(std::move(facts.liveness)), body_(std::move(facts.body)),
      static_region_(static_region) {
    graph_ = make_box<ConstraintGraph>(constraints_, definitions_.size(), static_region_);
    if (facts.scc_assignment) {
        sccs_ = ConstraintSccs::from_assignment(*facts.scc_assignment);
    } else {
        sccs_ = ConstraintSccs::compute(*graph_);
    }
}

auto RegionInferenceContext::to_error_region(RegionVid r) const -> std::optional<ErrorRegion> {
    const auto& def = definitions_[r.index()];
    switch (def.kind) {
    case RegionKind::Static:
        return ErrorRegion::static_region();
    case RegionKind::External:
    case RegionKind::Local:
        return def.external_name;
    case RegionKind::Existential:
        return std::nullopt;
    }
    return std::nullopt;
}

auto RegionInferenceContext::span_of(const Locations& locations) const -> SourceSpan {
    if (locations.kind == Locations::Kind::All) {
        return locations.span;
    }
    return body_.source_span(locations.location);
}

} // namespace regionck::region
