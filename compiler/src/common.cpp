#include "common.hpp"

namespace regionck {

auto operator<<(std::ostream& os, const SourceSpan& span) -> std::ostream& {
    if (span.is_dummy()) {
        return os << "<no location>";
    }
    return os << span.start.file << ":" << span.start.line << ":" << span.start.column << "-"
              << span.end.line << ":" << span.end.column;
}

} // namespace regionck
