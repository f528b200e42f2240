//! # Diagnostic Emitter
//!
//! Renders buffered diagnostics as text or JSON.
//!
//! ## Text Layout
//!
//! ```text
//! error[R0002]: borrowed data escapes outside of closure
//!   --> src/lib.rs:4:9
//!      |
//!    2 |     let mut f: Option<&u32> = None;
//!      |         ----- `f` is declared here, outside of the closure body
//!    3 |     closure_expecting_bound(|x: &u32| {
//!      |                              - `x` is a reference that is only valid in the closure body
//!    4 |         f = Some(x);
//!      |         ^^^^^^^^^^^ `x` escapes the closure body here
//!      |
//! ```
//!
//! Primary labels are underlined with `^`, secondary ones with `-`. Labels
//! without a location are printed as `= note` lines, and when the primary span
//! has no location the first located label anchors the snippet.

#ifndef REGIONCK_DIAG_EMITTER_HPP
#define REGIONCK_DIAG_EMITTER_HPP

#include "diag/diagnostic.hpp"
#include "diag/source_map.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace regionck::diag {

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";
    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

class DiagnosticEmitter {
public:
    DiagnosticEmitter(const SourceMap& source_map, std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    void set_format(DiagnosticFormat format) {
        format_ = format;
    }

    void emit(const Diagnostic& diag);

    /// Emits every diagnostic in buffer order.
    void emit_all(const DiagnosticBuffer& buffer);

    size_t error_count() const {
        return error_count_;
    }

private:
    const SourceMap& source_map_;
    std::ostream& out_;
    bool use_colors_ = false;
    DiagnosticFormat format_ = DiagnosticFormat::Text;
    size_t error_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const Diagnostic& diag);
    void emit_gutter(int line_width);
    void emit_source_snippet(const SourceSpan& primary, const std::vector<DiagnosticLabel>& labels);
    void emit_labeled_line(std::string_view file_path, uint32_t line,
                           const std::vector<DiagnosticLabel>& labels, int line_width);
    void emit_footer(const char* kind, const char* kind_color,
                     const std::vector<std::string>& lines);
    void emit_suggestions(const std::vector<DiagnosticSuggestion>& suggestions);

    void emit_json(const Diagnostic& diag);
    void emit_json_span(const SourceSpan& span);
    template <typename T, typename F>
    void emit_json_array(const char* key, const std::vector<T>& items, F emit_item);
};

/// Whether stderr is a color-capable terminal.
bool terminal_supports_colors();

/// Resolves `CheckerOptions::color` against the terminal.
bool colors_enabled();

} // namespace regionck::diag

#endif // REGIONCK_DIAG_EMITTER_HPP
