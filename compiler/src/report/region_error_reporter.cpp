#include "report/region_error_reporter.hpp"

#include "log/log.hpp"
#include "report/static_impl_trait.hpp"

namespace regionck::report {

auto report_shape_name(ReportShape shape) -> const char* {
    switch (shape) {
    case ReportShape::Specialized:
        return "specialized";
    case ReportShape::EscapingData:
        return "escaping-data";
    case ReportShape::General:
        return "general";
    }
    return "unknown";
}

auto RegionErrorReporter::body_kind_name() const -> const char* {
    return items_.is_closure(ctx_.body().item) ? "closure" : "function";
}

auto RegionErrorReporter::report_error(RegionVid fr, RegionVid outlived_fr,
                                       diag::DiagnosticBuffer& buffer) -> ReportShape {
    REGIONCK_LOG_DEBUG("report", "report_error(fr=" << fr << ", outlived_fr=" << outlived_fr
                                                    << ")");

    auto blame = selector_.best_blame(fr, [outlived_fr](RegionVid r) { return r == outlived_fr; });

    auto fr_region = ctx_.to_error_region(fr);
    auto outlived_region = ctx_.to_error_region(outlived_fr);
    if (fr_region && outlived_region) {
        if (nice_.try_report(blame.span, *outlived_region, *fr_region, buffer)) {
            REGIONCK_LOG_DEBUG("report", "handled by the specialized reporter");
            return ReportShape::Specialized;
        }
    }

    bool fr_is_local = ctx_.is_local_free_region(fr);
    bool outlived_fr_is_local = ctx_.is_local_free_region(outlived_fr);
    REGIONCK_LOG_DEBUG("report", "fr_is_local=" << fr_is_local << " outlived_fr_is_local="
                                                << outlived_fr_is_local
                                                << " category=" << blame.category);

    bool escaping_category = blame.category == ConstraintCategory::Assignment ||
                             blame.category == ConstraintCategory::CallArgument;
    if (escaping_category && fr_is_local && !outlived_fr_is_local) {
        return report_escaping_data_error(fr, outlived_fr, blame.category, blame.span, buffer);
    }

    report_general_error(fr, fr_is_local, outlived_fr, outlived_fr_is_local, blame.category,
                         blame.span, buffer);
    return ReportShape::General;
}

auto RegionErrorReporter::report_escaping_data_error(RegionVid fr, RegionVid outlived_fr,
                                                     ConstraintCategory category, SourceSpan span,
                                                     diag::DiagnosticBuffer& buffer)
    -> ReportShape {
    auto fr_name_and_span = namer_.resolve_var_and_span(fr);
    auto outlived_fr_name_and_span = namer_.resolve_var_and_span(outlived_fr);

    std::string escapes_from = body_kind_name();

    // Assignments are not escapes in function items.
    if ((!fr_name_and_span && !outlived_fr_name_and_span) ||
        (category == ConstraintCategory::Assignment && escapes_from == "function")) {
        REGIONCK_LOG_DEBUG("report", "escaping-data shape reverts to the general shape");
        report_general_error(fr, true, outlived_fr, false, category, span, buffer);
        return ReportShape::General;
    }

    auto diag =
        diag::DiagnosticBuilder::struct_span_err(span, "borrowed data escapes outside of " +
                                                           escapes_from);
    diag.code(diag::ErrorCodes::BORROWED_DATA_ESCAPES);

    if (outlived_fr_name_and_span && outlived_fr_name_and_span->name) {
        diag.span_label(outlived_fr_name_and_span->span,
                        "`" + *outlived_fr_name_and_span->name +
                            "` is declared here, outside of the " + escapes_from + " body");
    }

    if (fr_name_and_span && fr_name_and_span->name) {
        const auto& name = *fr_name_and_span->name;
        diag.span_label(fr_name_and_span->span, "`" + name +
                                                    "` is a reference that is only valid in the " +
                                                    escapes_from + " body");
        diag.span_label(span, "`" + name + "` escapes the " + escapes_from + " body here");
    }

    std::move(diag).buffer(buffer);
    return ReportShape::EscapingData;
}

void RegionErrorReporter::report_general_error(RegionVid fr, bool fr_is_local,
                                               RegionVid outlived_fr, bool outlived_fr_is_local,
                                               ConstraintCategory category, SourceSpan span,
                                               diag::DiagnosticBuffer& buffer) {
    auto diag = diag::DiagnosticBuilder::struct_span_err(span, "unsatisfied lifetime constraints");
    diag.code(diag::ErrorCodes::UNSATISFIED_CONSTRAINTS);

    uint32_t counter = 1;
    RegionName fr_name = namer_.give_region_a_name(fr, counter, diag);
    RegionName outlived_fr_name = namer_.give_region_a_name(outlived_fr, counter, diag);

    REGIONCK_LOG_TRACE("report", "general error: fr_is_local=" << fr_is_local << " names "
                                                               << fr_name << ", "
                                                               << outlived_fr_name);

    if (category == ConstraintCategory::Return && outlived_fr_is_local) {
        diag.span_label(span, std::string(body_kind_name()) +
                                  " was supposed to return data with lifetime `" +
                                  outlived_fr_name.name +
                                  "` but it is returning data with lifetime `" + fr_name.name +
                                  "`");
    } else {
        diag.span_label(span, std::string(region::category_phrase(category)) + "requires that `" +
                                  fr_name.name + "` must outlive `" + outlived_fr_name.name + "`");
    }

    add_static_impl_trait_suggestion(ctx_, items_, source_map_, diag, fr, fr_name, outlived_fr);

    std::move(diag).buffer(buffer);
}

} // namespace regionck::report
