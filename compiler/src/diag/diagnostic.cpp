#include "diag/diagnostic.hpp"

namespace regionck::diag {

auto applicability_name(Applicability applicability) -> const char* {
    switch (applicability) {
    case Applicability::MachineApplicable:
        return "machine-applicable";
    case Applicability::MaybeIncorrect:
        return "maybe-incorrect";
    case Applicability::HasPlaceholders:
        return "has-placeholders";
    case Applicability::Unspecified:
        return "unspecified";
    }
    return "unspecified";
}

auto Diagnostic::find_label(std::string_view needle) const -> const DiagnosticLabel* {
    for (const auto& label : labels) {
        if (label.message.find(needle) != std::string::npos) {
            return &label;
        }
    }
    return nullptr;
}

auto DiagnosticBuilder::struct_span_err(SourceSpan span, std::string message)
    -> DiagnosticBuilder {
    DiagnosticBuilder builder;
    builder.diag_.severity = DiagnosticSeverity::Error;
    builder.diag_.primary_span = span;
    builder.diag_.message = std::move(message);
    return builder;
}

auto DiagnosticBuilder::code(std::string code) -> DiagnosticBuilder& {
    diag_.code = std::move(code);
    return *this;
}

auto DiagnosticBuilder::span_label(SourceSpan span, std::string message) -> DiagnosticBuilder& {
    bool is_primary = span == diag_.primary_span;
    diag_.labels.push_back(DiagnosticLabel{span, std::move(message), is_primary});
    return *this;
}

auto DiagnosticBuilder::note(std::string message) -> DiagnosticBuilder& {
    diag_.notes.push_back(std::move(message));
    return *this;
}

auto DiagnosticBuilder::help(std::string message) -> DiagnosticBuilder& {
    diag_.help.push_back(std::move(message));
    return *this;
}

auto DiagnosticBuilder::span_suggestion(SourceSpan span, std::string message,
                                        std::string replacement, Applicability applicability)
    -> DiagnosticBuilder& {
    diag_.suggestions.push_back(
        DiagnosticSuggestion{span, std::move(message), std::move(replacement), applicability});
    return *this;
}

void DiagnosticBuilder::buffer(DiagnosticBuffer& buffer) && {
    buffer.push(std::move(diag_));
}

} // namespace regionck::diag
