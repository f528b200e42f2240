//! # Outlives Constraints
//!
//! The vocabulary shared by the constraint graph, the blame search and the
//! reporter: region variables, program locations and categorized
//! `sup: sub` constraints.
//!
//! ## Constraint Categories
//!
//! Every constraint carries the reason it was generated. The category never
//! affects path search; it is only used to rank edges when choosing what to
//! blame and to phrase the diagnostic.
//!
//! | Category           | Phrase                               |
//! |--------------------|--------------------------------------|
//! | Assignment         | "assignment "                        |
//! | Return             | "returning this value "              |
//! | Cast               | "cast "                              |
//! | CallArgument       | "argument "                          |
//! | TypeAnnotation     | "type annotation "                   |
//! | ClosureBounds      | "closure body "                      |
//! | SizedBound         | "proving this value is `Sized` "     |
//! | CopyBound          | "copying this value "                |
//! | OpaqueType         | "opaque type "                       |
//! | Boring             | ""                                   |
//! | BoringNoLocation   | ""                                   |
//! | Internal           | ""                                   |

#ifndef REGIONCK_REGION_CONSTRAINT_HPP
#define REGIONCK_REGION_CONSTRAINT_HPP

#include "common.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace regionck::region {

/// Dense index of a region variable.
///
/// Region variables are created by the inference engine before any
/// diagnostic work starts; all per-region state here is a flat vector indexed
/// by `RegionVid::index()`.
class RegionVid {
public:
    constexpr RegionVid() = default;
    constexpr explicit RegionVid(uint32_t index) : index_(index) {}

    [[nodiscard]] constexpr auto index() const -> uint32_t {
        return index_;
    }

    constexpr auto operator<=>(const RegionVid&) const = default;

private:
    uint32_t index_ = 0;
};

/// Prints a region as `'?N`.
auto operator<<(std::ostream& os, RegionVid r) -> std::ostream&;

/// Why an outlives constraint exists.
///
/// The declaration order is the fallback ranking used by the blame selector
/// when no edge can be picked structurally. Do not reorder.
enum class ConstraintCategory : uint8_t {
    Assignment,
    Return,
    Cast,
    CallArgument,
    TypeAnnotation,
    ClosureBounds,
    SizedBound,
    CopyBound,
    OpaqueType,
    /// Artifact of the type system setup (e.g. intermediate aggregate types).
    Boring,
    /// Boring and applicable everywhere.
    BoringNoLocation,
    /// Does not correspond to anything the user wrote.
    Internal,
};

/// Number of constraint categories.
constexpr size_t CONSTRAINT_CATEGORY_COUNT = 12;

/// Clause used in "{phrase}requires that ..." labels.
///
/// Non-empty phrases end in exactly one space so the label composes; the
/// bookkeeping categories render as the empty string.
[[nodiscard]] auto category_phrase(ConstraintCategory category) -> std::string_view;

/// Stable snake_case name (`call_argument`, `boring_no_location`, ...).
[[nodiscard]] auto category_name(ConstraintCategory category) -> std::string_view;

/// Inverse of `category_name`.
[[nodiscard]] auto parse_category(std::string_view name) -> std::optional<ConstraintCategory>;

/// Whether a category is bookkeeping that should never be blamed when a
/// user-visible alternative exists.
[[nodiscard]] auto is_uninteresting(ConstraintCategory category) -> bool;

auto operator<<(std::ostream& os, ConstraintCategory category) -> std::ostream&;

/// A point in the body: statement `statement_index` of basic block `block`.
struct Location {
    uint32_t block = 0;
    uint32_t statement_index = 0;

    auto operator<=>(const Location&) const = default;
};

auto operator<<(std::ostream& os, const Location& loc) -> std::ostream&;

/// Where a constraint must hold.
///
/// `All` constraints hold at every point and carry their own span. `Single`
/// constraints hold at one statement whose span comes from the body.
struct Locations {
    enum class Kind { All, Single };

    Kind kind = Kind::All;
    SourceSpan span;   ///< Only meaningful for `All`
    Location location; ///< Only meaningful for `Single`

    static auto all(SourceSpan span) -> Locations {
        return Locations{Kind::All, span, {}};
    }

    static auto single(Location location) -> Locations {
        return Locations{Kind::Single, {}, location};
    }
};

/// `sup: sub`, i.e. an edge `sup -> sub` in the constraint graph.
struct OutlivesConstraint {
    RegionVid sup;
    RegionVid sub;
    Locations locations;
    ConstraintCategory category = ConstraintCategory::Boring;
};

/// Two constraints are the same edge when endpoints and category agree.
auto operator==(const OutlivesConstraint& a, const OutlivesConstraint& b) -> bool;

auto operator<<(std::ostream& os, const OutlivesConstraint& c) -> std::ostream&;

/// Index into a `ConstraintSet`.
using ConstraintIndex = uint32_t;

/// All outlives constraints of a body, in generation order.
class ConstraintSet {
public:
    auto push(OutlivesConstraint constraint) -> ConstraintIndex;

    [[nodiscard]] auto operator[](ConstraintIndex idx) const -> const OutlivesConstraint& {
        return constraints_[idx];
    }

    [[nodiscard]] auto size() const -> size_t {
        return constraints_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return constraints_.empty();
    }

    [[nodiscard]] auto begin() const {
        return constraints_.begin();
    }

    [[nodiscard]] auto end() const {
        return constraints_.end();
    }

private:
    std::vector<OutlivesConstraint> constraints_;
};

} // namespace regionck::region

template <> struct std::hash<regionck::region::RegionVid> {
    auto operator()(regionck::region::RegionVid r) const noexcept -> size_t {
        return std::hash<uint32_t>{}(r.index());
    }
};

#endif // REGIONCK_REGION_CONSTRAINT_HPP
