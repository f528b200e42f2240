//! # Source Map
//!
//! Holds source file contents so spans can be turned back into text, both for
//! snippets in suggestions and for rendering.
//!
//! File paths are interned: `intern()` returns a view that stays valid for
//! the lifetime of the map, so spans can refer to files by `string_view`.

#ifndef REGIONCK_DIAG_SOURCE_MAP_HPP
#define REGIONCK_DIAG_SOURCE_MAP_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace regionck::diag {

/// Why a span could not be turned into text.
enum class SnippetError {
    DummySpan,      ///< The span has no location
    UnknownFile,    ///< No contents were registered for the file
    OutOfRange,     ///< The span lies outside the file
    MalformedSpan,  ///< The span ends before it starts
};

[[nodiscard]] auto snippet_error_message(SnippetError error) -> const char*;

class SourceMap {
public:
    SourceMap() = default;
    SourceMap(const SourceMap&) = delete;
    SourceMap& operator=(const SourceMap&) = delete;

    /// Stable view of `path`.
    auto intern(std::string_view path) -> std::string_view;

    /// Registers (or replaces) the contents of `path`.
    void add_file(std::string_view path, std::string contents);

    /// Reads `path` from disk and registers it.
    auto load_file(const std::string& path) -> Result<bool, std::string>;

    [[nodiscard]] auto has_file(std::string_view path) const -> bool;

    /// Text covered by `span`.
    [[nodiscard]] auto span_to_snippet(const SourceSpan& span) const
        -> Result<std::string, SnippetError>;

    /// Line `line` (1-based) of `path`, without its newline. Empty if unknown.
    [[nodiscard]] auto source_line(std::string_view path, uint32_t line) const -> std::string;

private:
    struct File {
        std::string contents;
        std::vector<size_t> line_starts;
        bool loaded = false;
    };

    [[nodiscard]] auto find(std::string_view path) const -> const File*;
    [[nodiscard]] static auto offset_of(const File& file, const SourceLocation& loc)
        -> std::optional<size_t>;

    // Node-based so interned keys never move.
    std::unordered_map<std::string, File> files_;
};

} // namespace regionck::diag

#endif // REGIONCK_DIAG_SOURCE_MAP_HPP
