#include "region/constraint.hpp"

#include <array>

namespace regionck::region {

auto operator<<(std::ostream& os, RegionVid r) -> std::ostream& {
    return os << "'?" << r.index();
}

namespace {

struct CategoryInfo {
    ConstraintCategory category;
    std::string_view name;
    std::string_view phrase;
};

// Indexed by the enumerator value.
constexpr std::array<CategoryInfo, CONSTRAINT_CATEGORY_COUNT> CATEGORY_TABLE = {{
    {ConstraintCategory::Assignment, "assignment", "assignment "},
    {ConstraintCategory::Return, "return", "returning this value "},
    {ConstraintCategory::Cast, "cast", "cast "},
    {ConstraintCategory::CallArgument, "call_argument", "argument "},
    {ConstraintCategory::TypeAnnotation, "type_annotation", "type annotation "},
    {ConstraintCategory::ClosureBounds, "closure_bounds", "closure body "},
    {ConstraintCategory::SizedBound, "sized_bound", "proving this value is `Sized` "},
    {ConstraintCategory::CopyBound, "copy_bound", "copying this value "},
    {ConstraintCategory::OpaqueType, "opaque_type", "opaque type "},
    {ConstraintCategory::Boring, "boring", ""},
    {ConstraintCategory::BoringNoLocation, "boring_no_location", ""},
    {ConstraintCategory::Internal, "internal", ""},
}};

auto info(ConstraintCategory category) -> const CategoryInfo& {
    return CATEGORY_TABLE[static_cast<size_t>(category)];
}

} // namespace

auto category_phrase(ConstraintCategory category) -> std::string_view {
    return info(category).phrase;
}

auto category_name(ConstraintCategory category) -> std::string_view {
    return info(category).name;
}

auto parse_category(std::string_view name) -> std::optional<ConstraintCategory> {
    for (const auto& entry : CATEGORY_TABLE) {
        if (entry.name == name) {
            return entry.category;
        }
    }
    return std::nullopt;
}

auto is_uninteresting(ConstraintCategory category) -> bool {
    switch (category) {
    case ConstraintCategory::OpaqueType:
    case ConstraintCategory::Boring:
    case ConstraintCategory::BoringNoLocation:
    case ConstraintCategory::Internal:
        return true;
    default:
        return false;
    }
}

auto operator<<(std::ostream& os, ConstraintCategory category) -> std::ostream& {
    return os << category_name(category);
}

auto operator<<(std::ostream& os, const Location& loc) -> std::ostream& {
    return os << "bb" << loc.block << "[" << loc.statement_index << "]";
}

auto operator==(const OutlivesConstraint& a, const OutlivesConstraint& b) -> bool {
    return a.sup == b.sup && a.sub == b.sub && a.category == b.category;
}

auto operator<<(std::ostream& os, const OutlivesConstraint& c) -> std::ostream& {
    os << c.sup << ": " << c.sub << " (" << c.category << " @ ";
    if (c.locations.kind == Locations::Kind::All) {
        os << "all " << c.locations.span;
    } else {
        os << c.locations.location;
    }
    return os << ")";
}

auto ConstraintSet::push(OutlivesConstraint constraint) -> ConstraintIndex {
    auto idx = static_cast<ConstraintIndex>(constraints_.size());
    constraints_.push_back(std::move(constraint));
    return idx;
}

} // namespace regionck::region
