#include "diag/emitter.hpp"

#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <set>
#include <unistd.h>

namespace regionck::diag {

namespace {

struct SeverityStyle {
    const char* name;
    const char* color;
};

// Indexed by DiagnosticSeverity.
constexpr std::array<SeverityStyle, 4> SEVERITY_STYLES = {{
    {"error", Colors::BrightRed},
    {"warning", Colors::BrightYellow},
    {"note", Colors::BrightCyan},
    {"help", Colors::BrightGreen},
}};

auto severity_style(DiagnosticSeverity severity) -> const SeverityStyle& {
    return SEVERITY_STYLES[static_cast<size_t>(severity)];
}

/// Columns `[start, end)` of `line` (0-based) covered by `label`.
auto underline_range(const DiagnosticLabel& label, uint32_t line, size_t line_length)
    -> std::pair<size_t, size_t> {
    size_t start = label.span.start.column > 0 ? label.span.start.column - 1 : 0;
    size_t end = line_length;
    if (label.span.end.line == line) {
        end = label.span.end.column > label.span.start.column ? label.span.end.column - 1
                                                              : start + 1;
    }
    start = std::min(start, line_length);
    end = std::min(end, line_length + 1);
    return {start, end};
}

auto escape_json(std::string_view s) -> std::string {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                static constexpr char HEX[] = "0123456789abcdef";
                result += "\\u00";
                result += HEX[(c >> 4) & 0xf];
                result += HEX[c & 0xf];
            } else {
                result += c;
            }
            break;
        }
    }
    return result;
}

} // namespace

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

bool colors_enabled() {
    switch (CheckerOptions::color) {
    case ColorChoice::Always:
        return true;
    case ColorChoice::Never:
        return false;
    case ColorChoice::Auto:
        return terminal_supports_colors();
    }
    return false;
}

// ============================================================================
// Text Output
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(const SourceMap& source_map, std::ostream& out)
    : source_map_(source_map), out_(out) {}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    const auto& style = severity_style(diag.severity);
    out_ << color(Colors::Bold) << color(style.color) << style.name;
    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }
    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_gutter(int line_width) {
    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |"
         << color(Colors::Reset);
}

void DiagnosticEmitter::emit_labeled_line(std::string_view file_path, uint32_t line,
                                          const std::vector<DiagnosticLabel>& labels,
                                          int line_width) {
    std::string text = source_map_.source_line(file_path, line);
    if (text.empty()) {
        return;
    }

    std::vector<const DiagnosticLabel*> on_line;
    for (const auto& label : labels) {
        if (label.span.start.file == file_path && label.span.start.line == line) {
            on_line.push_back(&label);
        }
    }
    std::stable_sort(on_line.begin(), on_line.end(),
                     [](const DiagnosticLabel* a, const DiagnosticLabel* b) {
                         return a->span.start.column < b->span.start.column;
                     });

    auto label_color = [this](const DiagnosticLabel& label) {
        return color(label.is_primary ? Colors::BrightRed : Colors::BrightBlue);
    };

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << line << " | "
         << color(Colors::Reset) << text << "\n";

    // Underlines left to right; overlapping labels still get one marker.
    emit_gutter(line_width);
    out_ << ' ';
    size_t column = 0;
    for (const auto* label : on_line) {
        auto [start, end] = underline_range(*label, line, text.size());
        if (column < start) {
            out_ << std::string(start - column, ' ');
            column = start;
        }
        size_t width = end > column ? end - column : 1;
        out_ << label_color(*label) << std::string(width, label->is_primary ? '^' : '-')
             << color(Colors::Reset);
        column += width;
    }

    // The rightmost message goes inline, the others on their own lines below.
    auto inline_it = std::find_if(on_line.rbegin(), on_line.rend(),
                                  [](const DiagnosticLabel* l) { return !l->message.empty(); });
    const DiagnosticLabel* inline_label = inline_it != on_line.rend() ? *inline_it : nullptr;
    if (inline_label) {
        out_ << " " << label_color(*inline_label) << inline_label->message
             << color(Colors::Reset);
    }
    out_ << "\n";

    for (const auto* label : on_line) {
        if (label == inline_label || label->message.empty()) {
            continue;
        }
        std::string indent(underline_range(*label, line, text.size()).first, ' ');
        emit_gutter(line_width);
        out_ << ' ' << indent << label_color(*label) << "|" << color(Colors::Reset) << "\n";
        emit_gutter(line_width);
        out_ << ' ' << indent << label_color(*label) << label->message << color(Colors::Reset)
             << "\n";
    }
}

void DiagnosticEmitter::emit_source_snippet(const SourceSpan& primary,
                                            const std::vector<DiagnosticLabel>& labels) {
    SourceSpan anchor = primary;
    if (anchor.is_dummy()) {
        auto located = std::find_if(labels.begin(), labels.end(),
                                    [](const DiagnosticLabel& l) { return !l.span.is_dummy(); });
        if (located == labels.end()) {
            return;
        }
        anchor = located->span;
    }

    std::string_view file_path = anchor.start.file;
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << file_path << ":"
         << anchor.start.line << ":" << anchor.start.column << "\n";

    if (!source_map_.has_file(file_path)) {
        return;
    }

    std::vector<DiagnosticLabel> shown;
    std::set<uint32_t> lines{anchor.start.line};
    for (const auto& label : labels) {
        if (label.span.is_dummy() || label.span.start.file != file_path) {
            continue;
        }
        shown.push_back(label);
        lines.insert(label.span.start.line);
    }
    bool has_primary = std::any_of(shown.begin(), shown.end(),
                                   [](const DiagnosticLabel& l) { return l.is_primary; });
    if (!has_primary && !primary.is_dummy()) {
        shown.insert(shown.begin(), DiagnosticLabel{primary, "", true});
    }

    int line_width = std::max(static_cast<int>(std::to_string(*lines.rbegin()).size()), 4);

    emit_gutter(line_width);
    out_ << "\n";

    uint32_t prev_line = 0;
    for (uint32_t line : lines) {
        if (prev_line > 0 && line > prev_line + 1) {
            out_ << color(Colors::BrightBlue) << std::setw(line_width - 1) << "" << "..."
                 << color(Colors::Reset) << "\n";
        }
        emit_labeled_line(file_path, line, shown, line_width);
        prev_line = line;
    }

    emit_gutter(line_width);
    out_ << "\n";
}

void DiagnosticEmitter::emit_footer(const char* kind, const char* kind_color,
                                    const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        out_ << color(kind_color) << "  = " << kind << color(Colors::Reset) << ": " << line
             << "\n";
    }
}

void DiagnosticEmitter::emit_suggestions(const std::vector<DiagnosticSuggestion>& suggestions) {
    for (const auto& suggestion : suggestions) {
        out_ << color(Colors::BrightGreen) << "help" << color(Colors::Reset) << ": "
             << suggestion.message << "\n";

        if (suggestion.span.is_dummy()) {
            continue;
        }
        const auto& span = suggestion.span;
        std::string text = source_map_.source_line(span.start.file, span.start.line);
        if (text.empty()) {
            out_ << "    " << suggestion.replacement << "\n";
            continue;
        }

        // Preview the line with the replacement applied.
        size_t start = std::min<size_t>(span.start.column > 0 ? span.start.column - 1 : 0,
                                        text.size());
        size_t end = text.size();
        if (span.end.line == span.start.line && span.end.column > 0) {
            end = std::clamp<size_t>(span.end.column - 1, start, text.size());
        }
        std::string patched = text.substr(0, start) + suggestion.replacement + text.substr(end);

        constexpr int line_width = 4;
        emit_gutter(line_width);
        out_ << "\n";
        out_ << color(Colors::BrightBlue) << std::setw(line_width) << span.start.line << " | "
             << color(Colors::Reset) << patched << "\n";
        emit_gutter(line_width);
        out_ << ' ' << std::string(start, ' ') << color(Colors::BrightGreen)
             << std::string(std::max<size_t>(suggestion.replacement.size(), 1), '~')
             << color(Colors::Reset) << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    }

    if (format_ == DiagnosticFormat::JSON) {
        emit_json(diag);
        return;
    }

    std::vector<std::string> unplaced;
    for (const auto& label : diag.labels) {
        if (label.span.is_dummy() && !label.message.empty()) {
            unplaced.push_back(label.message);
        }
    }

    emit_header(diag);
    emit_source_snippet(diag.primary_span, diag.labels);
    emit_footer("note", Colors::BrightCyan, unplaced);
    emit_footer("note", Colors::BrightCyan, diag.notes);
    emit_footer("help", Colors::BrightGreen, diag.help);
    emit_suggestions(diag.suggestions);
    out_ << "\n";
}

void DiagnosticEmitter::emit_all(const DiagnosticBuffer& buffer) {
    for (const auto& diag : buffer.diagnostics()) {
        emit(diag);
    }
}

// ============================================================================
// JSON Output
// ============================================================================

void DiagnosticEmitter::emit_json_span(const SourceSpan& span) {
    out_ << "{\"file\":\"" << escape_json(span.start.file) << "\","
         << "\"start\":{\"line\":" << span.start.line << ",\"column\":" << span.start.column
         << "},"
         << "\"end\":{\"line\":" << span.end.line << ",\"column\":" << span.end.column << "}}";
}

template <typename T, typename F>
void DiagnosticEmitter::emit_json_array(const char* key, const std::vector<T>& items,
                                        F emit_item) {
    out_ << "\"" << key << "\":[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out_ << ",";
        }
        emit_item(items[i]);
    }
    out_ << "]";
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag) {
    out_ << "{\"severity\":\"" << severity_style(diag.severity).name << "\","
         << "\"code\":\"" << escape_json(diag.code) << "\","
         << "\"message\":\"" << escape_json(diag.message) << "\",\"span\":";
    emit_json_span(diag.primary_span);
    out_ << ",";

    emit_json_array("labels", diag.labels, [this](const DiagnosticLabel& label) {
        out_ << "{\"message\":\"" << escape_json(label.message) << "\","
             << "\"is_primary\":" << (label.is_primary ? "true" : "false") << ",\"span\":";
        emit_json_span(label.span);
        out_ << "}";
    });
    out_ << ",";

    auto emit_string = [this](const std::string& s) { out_ << "\"" << escape_json(s) << "\""; };
    emit_json_array("notes", diag.notes, emit_string);
    out_ << ",";
    emit_json_array("help", diag.help, emit_string);
    out_ << ",";

    emit_json_array("suggestions", diag.suggestions, [this](const DiagnosticSuggestion& s) {
        out_ << "{\"message\":\"" << escape_json(s.message) << "\","
             << "\"replacement\":\"" << escape_json(s.replacement) << "\","
             << "\"applicability\":\"" << applicability_name(s.applicability) << "\",\"span\":";
        emit_json_span(s.span);
        out_ << "}";
    });

    out_ << "}\n";
}

} // namespace regionck::diag
