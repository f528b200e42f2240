//! # Common Definitions
//!
//! Types and utilities shared by every regionck component.
//!
//! ## Overview
//!
//! - **Version Information**: library version constants
//! - **Checker Options**: global configuration for diagnostics output
//! - **Source Locations**: positions and spans used by constraints and labels
//! - **Result Type**: recoverable errors without exceptions
//! - **Internal Errors**: the exception type for broken inference invariants
//!
//! ## Error Handling
//!
//! Expected alternate outcomes (a region without a name, a snippet that cannot
//! be fetched) are `std::optional`. Recoverable failures (I/O, malformed facts)
//! are `Result<T, E>`. A broken invariant of the inference engine is an
//! `InternalCompilerError` and is never shown as a normal diagnostic.

#ifndef REGIONCK_COMMON_HPP
#define REGIONCK_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace regionck {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Checker Configuration
// ============================================================================

/// Output format for rendered diagnostics.
enum class DiagnosticFormat {
    Text, ///< Human-readable text output (default)
    JSON  ///< One JSON object per diagnostic
};

/// When to color rendered diagnostics.
enum class ColorChoice {
    Auto,   ///< Color when stderr is a terminal
    Always, ///< Always emit ANSI escapes
    Never   ///< Never emit ANSI escapes
};

/// Global checker configuration.
///
/// Set once by the driver from command-line flags; read by the emitter.
///
/// ```cpp
/// CheckerOptions::diagnostic_format = DiagnosticFormat::JSON;
/// CheckerOptions::color = ColorChoice::Never;
/// ```
struct CheckerOptions {
    /// Output format for diagnostics.
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;

    /// Color policy for text diagnostics.
    static inline ColorChoice color = ColorChoice::Auto;

    /// Print the blame path of every reported violation.
    static inline bool verbose = false;
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A position in a source file.
///
/// Lines and columns are 1-based. A location with `line == 0` is the dummy
/// location used for constraints that have no source position.
struct SourceLocation {
    /// Path to the source file.
    std::string_view file;

    /// Line number (1-based, 0 for dummy).
    uint32_t line = 0;

    /// Column number (1-based).
    uint32_t column = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source text from `start` (inclusive) to `end` (exclusive).
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Whether this span points nowhere.
    [[nodiscard]] auto is_dummy() const -> bool {
        return start.line == 0;
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

/// Formats a span as `file:line:col-line:col`.
auto operator<<(std::ostream& os, const SourceSpan& span) -> std::ostream&;

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// Result<FactsProgram, FactsError> parsed = parse_facts(text, map);
/// if (is_err(parsed)) {
///     report(unwrap_err(parsed));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

// ============================================================================
// Internal Errors
// ============================================================================

/// An inconsistency in the data handed over by the inference engine.
///
/// Thrown when an invariant the caller guaranteed does not hold (for example a
/// blame path that must exist cannot be found). Callers are not expected to
/// recover; the driver turns it into an "internal compiler error" exit.
class InternalCompilerError : public std::logic_error {
public:
    explicit InternalCompilerError(const std::string& what) : std::logic_error(what) {}
};

} // namespace regionck

#endif // REGIONCK_COMMON_HPP
