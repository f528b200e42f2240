//! # Reporter Collaborators
//!
//! Interfaces the region error reporter consults but does not own:
//!
//! - `ItemContext`: what the surrounding program knows about items (is this a
//!   closure, which item binds a region, does it return `impl Trait`).
//! - `NiceRegionErrors`: a specialized reporter that may produce a better
//!   message for some errors and pre-empt the generic one.
//!
//! Each comes with a default implementation so the driver and tests can run
//! without a full compiler around them.

#ifndef REGIONCK_REPORT_COLLABORATORS_HPP
#define REGIONCK_REPORT_COLLABORATORS_HPP

#include "diag/diagnostic.hpp"
#include "region/region_context.hpp"

#include <map>
#include <optional>
#include <vector>

namespace regionck::report {

using region::ErrorRegion;
using region::ItemId;
using region::ItemKind;

/// An `impl Trait` return type.
struct OpaqueType {
    /// Item whose return type this is.
    ItemId def = 0;

    /// Span of the `impl Trait` text.
    SourceSpan span;

    /// Regions from `impl Trait + 'r` bounds.
    std::vector<ErrorRegion> outlives_bounds;
};

class ItemContext {
public:
    virtual ~ItemContext() = default;

    [[nodiscard]] virtual auto is_closure(ItemId item) const -> bool = 0;

    /// The function-like item whose signature binds `region`, if any.
    [[nodiscard]] virtual auto is_suitable_region(const ErrorRegion& region) const
        -> std::optional<ItemId> = 0;

    /// The opaque return type of `item`, if it returns `impl Trait`.
    [[nodiscard]] virtual auto return_type_impl_trait(ItemId item) const
        -> std::optional<OpaqueType> = 0;

    /// Whether `opaque` is declared `impl Trait + 'static`.
    [[nodiscard]] virtual auto opaque_has_static_bound(const OpaqueType& opaque) const -> bool;
};

/// `ItemContext` backed by plain tables.
class TableItemContext : public ItemContext {
public:
    void add_item(ItemId item, ItemKind kind) {
        items_[item] = kind;
    }

    void set_return_impl_trait(ItemId item, OpaqueType opaque) {
        opaques_[item] = std::move(opaque);
    }

    [[nodiscard]] auto is_closure(ItemId item) const -> bool override;

    [[nodiscard]] auto is_suitable_region(const ErrorRegion& region) const
        -> std::optional<ItemId> override;

    [[nodiscard]] auto return_type_impl_trait(ItemId item) const
        -> std::optional<OpaqueType> override;

private:
    std::map<ItemId, ItemKind> items_;
    std::map<ItemId, OpaqueType> opaques_;
};

/// Marker returned when a collaborator emitted a diagnostic itself.
struct ErrorReported {};

class NiceRegionErrors {
public:
    virtual ~NiceRegionErrors() = default;

    /// Reports `fr: outlived` at `span` if a specialized message applies.
    ///
    /// Returns nullopt to let the generic reporter handle it.
    [[nodiscard]] virtual auto try_report(const SourceSpan& span, const ErrorRegion& outlived,
                                          const ErrorRegion& fr, diag::DiagnosticBuffer& buffer)
        -> std::optional<ErrorReported> = 0;
};

/// Never handles anything.
class DeclineNiceRegionErrors : public NiceRegionErrors {
public:
    [[nodiscard]] auto try_report(const SourceSpan&, const ErrorRegion&, const ErrorRegion&,
                                  diag::DiagnosticBuffer&) -> std::optional<ErrorReported> override {
        return std::nullopt;
    }
};

} // namespace regionck::report

#endif // REGIONCK_REPORT_COLLABORATORS_HPP
