//! # Diagnostics
//!
//! Structured diagnostics produced by the region error reporter.
//!
//! A diagnostic is assembled with a `DiagnosticBuilder` and then buffered;
//! rendering happens later, after all violations of a body were reported.
//!
//! ## Error Codes
//!
//! | Code  | Diagnostic                                   |
//! |-------|----------------------------------------------|
//! | R0001 | unsatisfied lifetime constraints             |
//! | R0002 | borrowed data escapes outside of a body      |

#ifndef REGIONCK_DIAG_DIAGNOSTIC_HPP
#define REGIONCK_DIAG_DIAGNOSTIC_HPP

#include "common.hpp"

#include <string>
#include <vector>

namespace regionck::diag {

namespace ErrorCodes {
constexpr const char* UNSATISFIED_CONSTRAINTS = "R0001";
constexpr const char* BORROWED_DATA_ESCAPES = "R0002";
} // namespace ErrorCodes

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
    Help,
};

/// How confident a suggestion is.
enum class Applicability {
    MachineApplicable, ///< Can be applied without review
    MaybeIncorrect,    ///< Probably right, needs review
    HasPlaceholders,   ///< Contains text the user must fill in
    Unspecified,
};

[[nodiscard]] auto applicability_name(Applicability applicability) -> const char*;

struct DiagnosticLabel {
    SourceSpan span;
    std::string message;
    bool is_primary; // Primary label shown with ^^^, secondary with ---
};

/// A proposed edit: replace the text at `span` with `replacement`.
struct DiagnosticSuggestion {
    SourceSpan span;
    std::string message;
    std::string replacement;
    Applicability applicability = Applicability::Unspecified;
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string code;    // Error code, e.g. "R0001"
    std::string message; // Main message
    SourceSpan primary_span;
    std::vector<DiagnosticLabel> labels;
    std::vector<std::string> notes;
    std::vector<std::string> help;
    std::vector<DiagnosticSuggestion> suggestions;

    /// First label whose message contains `needle`, if any.
    [[nodiscard]] auto find_label(std::string_view needle) const -> const DiagnosticLabel*;
};

/// Append-only list of diagnostics waiting to be rendered.
class DiagnosticBuffer {
public:
    void push(Diagnostic diag) {
        diagnostics_.push_back(std::move(diag));
    }

    [[nodiscard]] auto diagnostics() const -> const std::vector<Diagnostic>& {
        return diagnostics_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return diagnostics_.size();
    }

    [[nodiscard]] auto empty() const -> bool {
        return diagnostics_.empty();
    }

    [[nodiscard]] auto operator[](size_t i) const -> const Diagnostic& {
        return diagnostics_[i];
    }

private:
    std::vector<Diagnostic> diagnostics_;
};

/// Fluent construction of a single diagnostic.
///
/// ```cpp
/// auto diag = DiagnosticBuilder::struct_span_err(span, "unsatisfied lifetime constraints");
/// diag.code(ErrorCodes::UNSATISFIED_CONSTRAINTS);
/// diag.span_label(span, "argument requires that `'a` must outlive `'b`");
/// std::move(diag).buffer(buffer);
/// ```
class DiagnosticBuilder {
public:
    [[nodiscard]] static auto struct_span_err(SourceSpan span, std::string message)
        -> DiagnosticBuilder;

    auto code(std::string code) -> DiagnosticBuilder&;

    /// Labels `span`. A label on the primary span is a primary label.
    auto span_label(SourceSpan span, std::string message) -> DiagnosticBuilder&;

    auto note(std::string message) -> DiagnosticBuilder&;

    auto help(std::string message) -> DiagnosticBuilder&;

    auto span_suggestion(SourceSpan span, std::string message, std::string replacement,
                         Applicability applicability) -> DiagnosticBuilder&;

    [[nodiscard]] auto diagnostic() const -> const Diagnostic& {
        return diag_;
    }

    /// Hands the diagnostic to `buffer`. The builder is consumed.
    void buffer(DiagnosticBuffer& buffer) &&;

private:
    DiagnosticBuilder() = default;

    Diagnostic diag_;
};

} // namespace regionck::diag

#endif // REGIONCK_DIAG_DIAGNOSTIC_HPP
