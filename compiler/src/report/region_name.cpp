#include "report/region_name.hpp"

#include "log/log.hpp"

namespace regionck::report {

auto operator<<(std::ostream& os, const RegionName& name) -> std::ostream& {
    return os << name.name;
}

auto RegionNamer::give_region_a_name(RegionVid r, uint32_t& counter,
                                     diag::DiagnosticBuilder& diag) const -> RegionName {
    if (auto name = resolve_name(r)) {
        REGIONCK_LOG_TRACE("report", "region " << r << " is named " << *name);
        return RegionName{RegionName::Source::Named, *name};
    }

    RegionName synthesized{RegionName::Source::Synthesized, "'" + std::to_string(counter++)};
    REGIONCK_LOG_TRACE("report", "region " << r << " synthesized as " << synthesized);

    if (auto var = resolve_var_and_span(r); var && !var->span.is_dummy()) {
        diag.span_label(var->span, "let's call the lifetime of this reference `" +
                                       synthesized.name + "`");
    }
    return synthesized;
}

auto ContextRegionNamer::resolve_name(RegionVid r) const -> std::optional<std::string> {
    const auto& def = ctx_.definition(r);
    if (def.kind == region::RegionKind::Static) {
        return std::string("'static");
    }
    if (def.user_name) {
        return def.user_name;
    }
    if (def.external_name && def.external_name->name) {
        return def.external_name->name;
    }
    return std::nullopt;
}

auto ContextRegionNamer::resolve_var_and_span(RegionVid r) const -> std::optional<VarNameAndSpan> {
    const auto& def = ctx_.definition(r);
    if (!def.var_span) {
        return std::nullopt;
    }
    return VarNameAndSpan{def.var_name, *def.var_span};
}

} // namespace regionck::report
