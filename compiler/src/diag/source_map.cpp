#include "diag/source_map.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace regionck::diag {

auto snippet_error_message(SnippetError error) -> const char* {
    switch (error) {
    case SnippetError::DummySpan:
        return "span has no source location";
    case SnippetError::UnknownFile:
        return "source file is not loaded";
    case SnippetError::OutOfRange:
        return "span lies outside the source file";
    case SnippetError::MalformedSpan:
        return "span ends before it starts";
    }
    return "unknown snippet error";
}

auto SourceMap::intern(std::string_view path) -> std::string_view {
    auto it = files_.try_emplace(std::string(path)).first;
    return it->first;
}

void SourceMap::add_file(std::string_view path, std::string contents) {
    auto& file = files_[std::string(path)];
    file.contents = std::move(contents);
    file.line_starts.clear();
    file.line_starts.push_back(0);
    for (size_t i = 0; i < file.contents.size(); ++i) {
        if (file.contents[i] == '\n') {
            file.line_starts.push_back(i + 1);
        }
    }
    file.loaded = true;
}

auto SourceMap::load_file(const std::string& path) -> Result<bool, std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return "cannot open source file: " + path;
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    add_file(path, contents.str());
    REGIONCK_LOG_INFO("driver", "loaded source " << path);
    return true;
}

auto SourceMap::find(std::string_view path) const -> const File* {
    auto it = files_.find(std::string(path));
    if (it == files_.end() || !it->second.loaded) {
        return nullptr;
    }
    return &it->second;
}

auto SourceMap::has_file(std::string_view path) const -> bool {
    return find(path) != nullptr;
}

auto SourceMap::offset_of(const File& file, const SourceLocation& loc) -> std::optional<size_t> {
    if (loc.line == 0 || loc.line > file.line_starts.size() || loc.column == 0) {
        return std::nullopt;
    }
    size_t line_start = file.line_starts[loc.line - 1];
    size_t line_end = loc.line < file.line_starts.size() ? file.line_starts[loc.line] - 1
                                                         : file.contents.size();
    size_t offset = line_start + loc.column - 1;
    // One past the last character of the line is a valid end position.
    if (offset > line_end) {
        return std::nullopt;
    }
    return offset;
}

auto SourceMap::span_to_snippet(const SourceSpan& span) const -> Result<std::string, SnippetError> {
    if (span.is_dummy()) {
        return SnippetError::DummySpan;
    }
    const File* file = find(span.start.file);
    if (!file) {
        return SnippetError::UnknownFile;
    }
    auto start = offset_of(*file, span.start);
    auto end = offset_of(*file, span.end);
    if (!start || !end) {
        return SnippetError::OutOfRange;
    }
    if (*end < *start) {
        return SnippetError::MalformedSpan;
    }
    return file->contents.substr(*start, *end - *start);
}

auto SourceMap::source_line(std::string_view path, uint32_t line) const -> std::string {
    const File* file = find(path);
    if (!file || line == 0 || line > file->line_starts.size()) {
        return "";
    }
    size_t start = file->line_starts[line - 1];
    size_t end = line < file->line_starts.size() ? file->line_starts[line] - 1
                                                 : file->contents.size();
    std::string text = file->contents.substr(start, end - start);
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }
    return text;
}

} // namespace regionck::diag
