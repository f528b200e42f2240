#include "report/collaborators.hpp"

#include <algorithm>

namespace regionck::report {

auto ItemContext::opaque_has_static_bound(const OpaqueType& opaque) const -> bool {
    return std::any_of(opaque.outlives_bounds.begin(), opaque.outlives_bounds.end(),
                       [](const ErrorRegion& r) { return r.is_static(); });
}

auto TableItemContext::is_closure(ItemId item) const -> bool {
    auto it = items_.find(item);
    return it != items_.end() && it->second == ItemKind::Closure;
}

auto TableItemContext::is_suitable_region(const ErrorRegion& region) const
    -> std::optional<ItemId> {
    if (region.is_static() || !region.scope) {
        return std::nullopt;
    }
    auto it = items_.find(*region.scope);
    // Closures are not function-like items here.
    if (it == items_.end() || it->second != ItemKind::Function) {
        return std::nullopt;
    }
    return it->first;
}

auto TableItemContext::return_type_impl_trait(ItemId item) const -> std::optional<OpaqueType> {
    auto it = opaques_.find(item);
    if (it == opaques_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace regionck::report
