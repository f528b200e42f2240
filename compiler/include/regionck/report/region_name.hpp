//! # Region Naming
//!
//! Turns region variables into the names shown in diagnostics.
//!
//! A region the user wrote a lifetime for (or `'static`) is shown by that
//! name. Anything else gets a synthesized name `'1`, `'2`, ... drawn from a
//! counter shared by all regions mentioned in one diagnostic, and where
//! possible a label pointing at the reference the name stands for:
//!
//! ```text
//!    1 | fn first(x: &u32, y: &u32) -> &u32 {
//!      |             - let's call the lifetime of this reference `'1`
//! ```

#ifndef REGIONCK_REPORT_REGION_NAME_HPP
#define REGIONCK_REPORT_REGION_NAME_HPP

#include "diag/diagnostic.hpp"
#include "region/region_context.hpp"

#include <optional>
#include <ostream>
#include <string>

namespace regionck::report {

using region::RegionVid;

/// A region name as printed in a diagnostic.
struct RegionName {
    enum class Source {
        Named,       ///< Written by the user or known to the type system
        Synthesized, ///< Made up for this diagnostic
    };

    Source source = Source::Synthesized;
    std::string name;

    [[nodiscard]] auto is_synthesized() const -> bool {
        return source == Source::Synthesized;
    }

    [[nodiscard]] auto operator==(const RegionName& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const RegionName& name) -> std::ostream&;

/// The variable whose type mentions a region, and where it is declared.
struct VarNameAndSpan {
    /// Absent when the variable is anonymous (e.g. a pattern binding).
    std::optional<std::string> name;
    SourceSpan span;
};

/// Naming service used by the reporter.
class RegionNamer {
public:
    virtual ~RegionNamer() = default;

    /// The lifetime name of `r`, if it has one.
    [[nodiscard]] virtual auto resolve_name(RegionVid r) const -> std::optional<std::string> = 0;

    /// Argument or captured variable whose type mentions `r`.
    [[nodiscard]] virtual auto resolve_var_and_span(RegionVid r) const
        -> std::optional<VarNameAndSpan> = 0;

    /// Names `r` for a diagnostic under construction.
    ///
    /// Unnamed regions take the next value of `counter` and, when the
    /// variable they belong to is known, label it in `diag`.
    auto give_region_a_name(RegionVid r, uint32_t& counter, diag::DiagnosticBuilder& diag) const
        -> RegionName;
};

/// Names regions from the definitions held by an inference context.
///
/// User-written names win over external names; `'static` is always named.
class ContextRegionNamer : public RegionNamer {
public:
    explicit ContextRegionNamer(const region::RegionInferenceContext& ctx) : ctx_(ctx) {}

    [[nodiscard]] auto resolve_name(RegionVid r) const -> std::optional<std::string> override;

    [[nodiscard]] auto resolve_var_and_span(RegionVid r) const
        -> std::optional<VarNameAndSpan> override;

private:
    const region::RegionInferenceContext& ctx_;
};

} // namespace regionck::report

#endif // REGIONCK_REPORT_REGION_NAME_HPP
