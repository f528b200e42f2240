//! # Region Error Reporter
//!
//! Turns a violated outlives requirement `fr: outlived_fr` into exactly one
//! buffered diagnostic.
//!
//! ## Dispatch
//!
//! 1. The best constraint to blame is picked by the `BlameSelector`.
//! 2. If both regions have external names, the specialized reporter gets the
//!    first chance; when it handles the error nothing else is emitted.
//! 3. Assignments and call arguments that move a body-local reference into
//!    something that outlives the body are reported as escaping data
//!    (`R0002`).
//! 4. Everything else is an unsatisfied lifetime constraint (`R0001`), phrased
//!    after the blamed category.
//!
//! ## Example
//!
//! ```cpp
//! ContextRegionNamer namer(*ctx);
//! DeclineNiceRegionErrors nice;
//! RegionErrorReporter reporter(*ctx, items, namer, nice, source_map);
//! diag::DiagnosticBuffer buffer;
//! reporter.report_error(fr, outlived_fr, buffer);
//! ```

#ifndef REGIONCK_REPORT_REGION_ERROR_REPORTER_HPP
#define REGIONCK_REPORT_REGION_ERROR_REPORTER_HPP

#include "blame/blame_selector.hpp"
#include "diag/diagnostic.hpp"
#include "diag/source_map.hpp"
#include "report/collaborators.hpp"
#include "report/region_name.hpp"

namespace regionck::report {

using region::ConstraintCategory;

/// Which diagnostic `report_error` produced.
enum class ReportShape {
    Specialized,  ///< The specialized reporter handled it
    EscapingData, ///< "borrowed data escapes outside of ..."
    General,      ///< "unsatisfied lifetime constraints"
};

[[nodiscard]] auto report_shape_name(ReportShape shape) -> const char*;

class RegionErrorReporter {
public:
    RegionErrorReporter(const region::RegionInferenceContext& ctx, const ItemContext& items,
                        const RegionNamer& namer, NiceRegionErrors& nice,
                        const diag::SourceMap& source_map)
        : ctx_(ctx), items_(items), namer_(namer), nice_(nice), source_map_(source_map),
          selector_(ctx) {}

    /// Reports that `fr` was required to outlive `outlived_fr` but is not
    /// known to.
    ///
    /// Both are universal regions. Throws `InternalCompilerError` if no
    /// constraint path connects them.
    auto report_error(RegionVid fr, RegionVid outlived_fr, diag::DiagnosticBuffer& buffer)
        -> ReportShape;

    [[nodiscard]] auto selector() const -> const blame::BlameSelector& {
        return selector_;
    }

private:
    auto report_escaping_data_error(RegionVid fr, RegionVid outlived_fr,
                                    ConstraintCategory category, SourceSpan span,
                                    diag::DiagnosticBuffer& buffer) -> ReportShape;

    void report_general_error(RegionVid fr, bool fr_is_local, RegionVid outlived_fr,
                              bool outlived_fr_is_local, ConstraintCategory category,
                              SourceSpan span, diag::DiagnosticBuffer& buffer);

    [[nodiscard]] auto body_kind_name() const -> const char*;

    const region::RegionInferenceContext& ctx_;
    const ItemContext& items_;
    const RegionNamer& namer_;
    NiceRegionErrors& nice_;
    const diag::SourceMap& source_map_;
    blame::BlameSelector selector_;
};

} // namespace regionck::report

#endif // REGIONCK_REPORT_REGION_ERROR_REPORTER_HPP
