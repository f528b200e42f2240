//! # `impl Trait` Capture Suggestions
//!
//! When a function returning `impl Trait` is found to require that one of its
//! lifetimes outlive `'static`, the usual cause is that the opaque type
//! captures borrowed data without saying so:
//!
//! ```text
//! fn iter(v: &Vec<u32>) -> impl Iterator<Item = &u32> { v.iter() }
//! ```
//!
//! Two outcomes:
//!
//! - the opaque type already says `+ 'static`: the only sensible advice is to
//!   replace the offending lifetime with `'static` (a help line);
//! - otherwise: a machine-applicable edit appending `+ 'a` (or `+ '_` for a
//!   synthesized name) to the `impl Trait` text.

#ifndef REGIONCK_REPORT_STATIC_IMPL_TRAIT_HPP
#define REGIONCK_REPORT_STATIC_IMPL_TRAIT_HPP

#include "diag/diagnostic.hpp"
#include "diag/source_map.hpp"
#include "region/region_context.hpp"
#include "report/collaborators.hpp"
#include "report/region_name.hpp"

namespace regionck::report {

/// What `add_static_impl_trait_suggestion` attached.
enum class ImplTraitSuggestion {
    None,
    ReplaceWithStatic, ///< Help: "consider replacing ... with `'static`"
    AddBound,          ///< Edit: append `+ 'r` to the opaque type
};

/// Suggests a fix for `fr: outlived_fr` when `outlived_fr` is `'static` and
/// `fr` belongs to a function returning `impl Trait`.
///
/// `fr_name` must be the name already given to `fr` in `diag`; naming it
/// again could label it twice.
auto add_static_impl_trait_suggestion(const region::RegionInferenceContext& ctx,
                                      const ItemContext& items, const diag::SourceMap& source_map,
                                      diag::DiagnosticBuilder& diag, RegionVid fr,
                                      const RegionName& fr_name, RegionVid outlived_fr)
    -> ImplTraitSuggestion;

} // namespace regionck::report

#endif // REGIONCK_REPORT_STATIC_IMPL_TRAIT_HPP
