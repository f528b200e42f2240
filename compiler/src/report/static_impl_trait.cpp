#include "report/static_impl_trait.hpp"

#include "log/log.hpp"

namespace regionck::report {

auto add_static_impl_trait_suggestion(const region::RegionInferenceContext& ctx,
                                      const ItemContext& items, const diag::SourceMap& source_map,
                                      diag::DiagnosticBuilder& diag, RegionVid fr,
                                      const RegionName& fr_name, RegionVid outlived_fr)
    -> ImplTraitSuggestion {
    auto fr_region = ctx.to_error_region(fr);
    auto outlived_region = ctx.to_error_region(outlived_fr);
    if (!fr_region || !outlived_region || !outlived_region->is_static()) {
        return ImplTraitSuggestion::None;
    }

    auto item = items.is_suitable_region(*fr_region);
    if (!item) {
        return ImplTraitSuggestion::None;
    }
    auto opaque = items.return_type_impl_trait(*item);
    if (!opaque) {
        return ImplTraitSuggestion::None;
    }

    bool has_static_predicate = items.opaque_has_static_bound(*opaque);
    REGIONCK_LOG_DEBUG("suggest",
                       "impl Trait of item " << *item << " has_static_predicate="
                                             << (has_static_predicate ? "true" : "false"));

    if (has_static_predicate) {
        diag.help("consider replacing `" + fr_name.name + "` with `'static`");
        return ImplTraitSuggestion::ReplaceWithStatic;
    }

    auto snippet = source_map.span_to_snippet(opaque->span);
    if (is_err(snippet)) {
        REGIONCK_LOG_DEBUG("suggest", "no snippet for " << opaque->span << ": "
                                                        << diag::snippet_error_message(
                                                               unwrap_err(snippet)));
        return ImplTraitSuggestion::None;
    }

    std::string bound = fr_name.is_synthesized() ? "'_" : fr_name.name;
    diag.span_suggestion(opaque->span,
                         "to allow this impl Trait to capture borrowed data with lifetime `" +
                             fr_name.name + "`, add `" + bound + "` as a constraint",
                         unwrap(snippet) + " + " + bound,
                         diag::Applicability::MachineApplicable);
    return ImplTraitSuggestion::AddBound;
}

} // namespace regionck::report
