#include "facts/facts_parser.hpp"

#include "log/log.hpp"

#include <charconv>
#include <fstream>
#include <map>
#include <sstream>

namespace regionck::facts {

using region::ConstraintCategory;
using region::ErrorRegion;
using region::Location;
using region::Locations;
using region::OutlivesConstraint;
using region::RegionDefinition;
using region::RegionKind;

auto operator<<(std::ostream& os, const FactsError& error) -> std::ostream& {
    if (error.line > 0) {
        os << "line " << error.line << ": ";
    }
    return os << error.message;
}

namespace {

// ============================================================================
// Token Helpers
// ============================================================================

auto parse_u32(std::string_view text) -> std::optional<uint32_t> {
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

/// Splits `a<sep>b` at the first `sep`.
auto split_pair(std::string_view text, char sep)
    -> std::optional<std::pair<std::string_view, std::string_view>> {
    size_t pos = text.find(sep);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    return std::make_pair(text.substr(0, pos), text.substr(pos + 1));
}

auto parse_position(std::string_view text, std::string_view file)
    -> std::optional<SourceLocation> {
    auto parts = split_pair(text, ':');
    if (!parts) {
        return std::nullopt;
    }
    auto line = parse_u32(parts->first);
    auto column = parse_u32(parts->second);
    if (!line || !column || *line == 0 || *column == 0) {
        return std::nullopt;
    }
    return SourceLocation{file, *line, *column};
}

/// `line:col-line:col`
auto parse_span(std::string_view text, std::string_view file) -> std::optional<SourceSpan> {
    auto parts = split_pair(text, '-');
    if (!parts) {
        return std::nullopt;
    }
    auto start = parse_position(parts->first, file);
    auto end = parse_position(parts->second, file);
    if (!start || !end) {
        return std::nullopt;
    }
    return SourceSpan{*start, *end};
}

/// `block:statement`
auto parse_location(std::string_view text) -> std::optional<Location> {
    auto parts = split_pair(text, ':');
    if (!parts) {
        return std::nullopt;
    }
    auto block = parse_u32(parts->first);
    auto statement = parse_u32(parts->second);
    if (!block || !statement) {
        return std::nullopt;
    }
    return Location{*block, *statement};
}

/// Splits a line into whitespace-separated tokens, dropping a trailing
/// comment. `#` only starts a comment at the beginning of a token.
auto tokenize(std::string_view line) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t' || line[i] == '\r')) {
            ++i;
        }
        if (i >= line.size() || line[i] == '#') {
            break;
        }
        size_t start = i;
        while (i < line.size() && line[i] != ' ' && line[i] != '\t' && line[i] != '\r') {
            ++i;
        }
        tokens.push_back(line.substr(start, i - start));
    }
    return tokens;
}

// ============================================================================
// Parser
// ============================================================================

struct PendingOpaque {
    uint32_t line;
    uint32_t region;
    SourceSpan span;
    bool has_static_bound;
};

struct RegionUse {
    uint32_t line;
    uint32_t region;
};

class FactsParser {
public:
    FactsParser(diag::SourceMap& source_map, std::string_view default_file)
        : source_map_(source_map), file_(source_map.intern(default_file)) {}

    auto parse(std::string_view text) -> Result<FactsProgram, FactsError>;

private:
    auto directive(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;

    auto parse_source(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_item(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_region(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_opaque(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_outlives(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_point(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_live(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_scc(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;
    auto parse_error(const std::vector<std::string_view>& tokens) -> std::optional<FactsError>;

    auto finish() -> Result<FactsProgram, FactsError>;

    auto fail(std::string message) const -> FactsError {
        return FactsError{line_, std::move(message)};
    }

    auto expect_region_id(std::string_view token, const char* what)
        -> Result<uint32_t, FactsError>;

    diag::SourceMap& source_map_;
    std::string_view file_;
    uint32_t line_ = 0;

    std::string source_path_;
    bool seen_item_ = false;
    region::BodyInfo body_;
    std::map<uint32_t, RegionDefinition> regions_;
    std::vector<PendingOpaque> opaques_;
    std::vector<std::pair<uint32_t, OutlivesConstraint>> constraints_;
    std::vector<std::pair<RegionUse, Location>> live_;
    std::map<uint32_t, uint32_t> scc_;
    std::vector<Violation> violations_;
};

auto FactsParser::expect_region_id(std::string_view token, const char* what)
    -> Result<uint32_t, FactsError> {
    auto id = parse_u32(token);
    if (!id) {
        return fail(std::string("invalid ") + what + " region id `" + std::string(token) + "`");
    }
    return *id;
}

auto FactsParser::parse(std::string_view text) -> Result<FactsProgram, FactsError> {
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        ++line_;
        auto tokens = tokenize(text.substr(pos, end - pos));
        if (!tokens.empty()) {
            if (auto error = directive(tokens)) {
                REGIONCK_LOG_DEBUG("facts", "rejected " << *error);
                return *error;
            }
        }
        if (end == text.size()) {
            break;
        }
        pos = end + 1;
    }
    return finish();
}

auto FactsParser::directive(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    std::string_view keyword = tokens[0];
    if (keyword == "source")
        return parse_source(tokens);
    if (keyword == "item")
        return parse_item(tokens);
    if (keyword == "region")
        return parse_region(tokens);
    if (keyword == "opaque")
        return parse_opaque(tokens);
    if (keyword == "outlives")
        return parse_outlives(tokens);
    if (keyword == "point")
        return parse_point(tokens);
    if (keyword == "live")
        return parse_live(tokens);
    if (keyword == "scc")
        return parse_scc(tokens);
    if (keyword == "error")
        return parse_error(tokens);
    return fail("unknown directive `" + std::string(keyword) + "`");
}

auto FactsParser::parse_source(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 2) {
        return fail("expected `source <path>`");
    }
    source_path_ = std::string(tokens[1]);
    file_ = source_map_.intern(tokens[1]);
    return std::nullopt;
}

auto FactsParser::parse_item(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 4) {
        return fail("expected `item function|closure <name> <span>`");
    }
    if (seen_item_) {
        return fail("duplicate item directive");
    }
    if (tokens[1] == "function") {
        body_.kind = region::ItemKind::Function;
    } else if (tokens[1] == "closure") {
        body_.kind = region::ItemKind::Closure;
    } else {
        return fail("unknown item kind `" + std::string(tokens[1]) + "`");
    }
    auto span = parse_span(tokens[3], file_);
    if (!span) {
        return fail("invalid span `" + std::string(tokens[3]) + "`");
    }
    body_.name = std::string(tokens[2]);
    body_.span = *span;
    seen_item_ = true;
    return std::nullopt;
}

auto FactsParser::parse_region(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() < 3) {
        return fail("expected `region <id> <kind> [name=<'n>] [var=<name>@<span>]`");
    }
    auto id = expect_region_id(tokens[1], "region");
    if (is_err(id)) {
        return unwrap_err(id);
    }
    if (regions_.count(unwrap(id)) > 0) {
        return fail("region " + std::to_string(unwrap(id)) + " declared twice");
    }

    RegionDefinition def;
    std::string_view kind = tokens[2];
    if (kind == "static") {
        def.kind = RegionKind::Static;
    } else if (kind == "external") {
        def.kind = RegionKind::External;
    } else if (kind == "local") {
        def.kind = RegionKind::Local;
    } else if (kind == "existential") {
        def.kind = RegionKind::Existential;
    } else {
        return fail("unknown region kind `" + std::string(kind) + "`");
    }

    for (size_t i = 3; i < tokens.size(); ++i) {
        auto attr = split_pair(tokens[i], '=');
        if (!attr) {
            return fail("expected `key=value`, found `" + std::string(tokens[i]) + "`");
        }
        auto [key, value] = *attr;
        if (key == "name") {
            if (value.size() < 2 || value[0] != '\'') {
                return fail("lifetime name must start with `'`");
            }
            def.user_name = std::string(value);
        } else if (key == "var") {
            auto var = split_pair(value, '@');
            if (!var) {
                return fail("expected `var=<name>@<span>`");
            }
            auto span = parse_span(var->second, file_);
            if (!span) {
                return fail("invalid span `" + std::string(var->second) + "`");
            }
            // An empty name stands for an anonymous binding.
            if (!var->first.empty()) {
                def.var_name = std::string(var->first);
            }
            def.var_span = *span;
        } else {
            return fail("unknown region attribute `" + std::string(key) + "`");
        }
    }

    if (def.kind == RegionKind::Static) {
        def.external_name = ErrorRegion::static_region();
    } else if (def.is_universal()) {
        auto region_kind = def.user_name ? ErrorRegion::Kind::EarlyBound : ErrorRegion::Kind::Free;
        def.external_name = ErrorRegion{region_kind, def.user_name, body_.item};
    }

    regions_.emplace(unwrap(id), std::move(def));
    return std::nullopt;
}

auto FactsParser::parse_opaque(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 3 && tokens.size() != 4) {
        return fail("expected `opaque <region> <span> [static]`");
    }
    auto id = expect_region_id(tokens[1], "opaque");
    if (is_err(id)) {
        return unwrap_err(id);
    }
    auto span = parse_span(tokens[2], file_);
    if (!span) {
        return fail("invalid span `" + std::string(tokens[2]) + "`");
    }
    bool has_static = false;
    if (tokens.size() == 4) {
        if (tokens[3] != "static") {
            return fail("expected `static`, found `" + std::string(tokens[3]) + "`");
        }
        has_static = true;
    }
    opaques_.push_back(PendingOpaque{line_, unwrap(id), *span, has_static});
    return std::nullopt;
}

auto FactsParser::parse_outlives(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 6) {
        return fail("expected `outlives <sup> <sub> <category> all <span>` or "
                    "`outlives <sup> <sub> <category> at <block>:<stmt>`");
    }
    auto sup = expect_region_id(tokens[1], "sup");
    if (is_err(sup)) {
        return unwrap_err(sup);
    }
    auto sub = expect_region_id(tokens[2], "sub");
    if (is_err(sub)) {
        return unwrap_err(sub);
    }
    auto category = region::parse_category(tokens[3]);
    if (!category) {
        return fail("unknown constraint category `" + std::string(tokens[3]) + "`");
    }

    Locations locations;
    if (tokens[4] == "all") {
        auto span = parse_span(tokens[5], file_);
        if (!span) {
            return fail("invalid span `" + std::string(tokens[5]) + "`");
        }
        locations = Locations::all(*span);
    } else if (tokens[4] == "at") {
        auto loc = parse_location(tokens[5]);
        if (!loc) {
            return fail("invalid location `" + std::string(tokens[5]) + "`");
        }
        locations = Locations::single(*loc);
    } else {
        return fail("expected `all` or `at`, found `" + std::string(tokens[4]) + "`");
    }

    constraints_.emplace_back(line_, OutlivesConstraint{RegionVid(unwrap(sup)),
                                                        RegionVid(unwrap(sub)), locations,
                                                        *category});
    return std::nullopt;
}

auto FactsParser::parse_point(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 3) {
        return fail("expected `point <block>:<stmt> <span>`");
    }
    auto loc = parse_location(tokens[1]);
    if (!loc) {
        return fail("invalid location `" + std::string(tokens[1]) + "`");
    }
    auto span = parse_span(tokens[2], file_);
    if (!span) {
        return fail("invalid span `" + std::string(tokens[2]) + "`");
    }
    body_.statement_spans[*loc] = *span;
    return std::nullopt;
}

auto FactsParser::parse_live(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 3) {
        return fail("expected `live <region> <block>:<stmt>`");
    }
    auto id = expect_region_id(tokens[1], "live");
    if (is_err(id)) {
        return unwrap_err(id);
    }
    auto loc = parse_location(tokens[2]);
    if (!loc) {
        return fail("invalid location `" + std::string(tokens[2]) + "`");
    }
    live_.emplace_back(RegionUse{line_, unwrap(id)}, *loc);
    return std::nullopt;
}

auto FactsParser::parse_scc(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 3) {
        return fail("expected `scc <region> <group>`");
    }
    auto id = expect_region_id(tokens[1], "scc");
    if (is_err(id)) {
        return unwrap_err(id);
    }
    auto group = parse_u32(tokens[2]);
    if (!group) {
        return fail("invalid SCC group `" + std::string(tokens[2]) + "`");
    }
    if (!scc_.emplace(unwrap(id), *group).second) {
        return fail("region " + std::to_string(unwrap(id)) + " assigned to two SCCs");
    }
    return std::nullopt;
}

auto FactsParser::parse_error(const std::vector<std::string_view>& tokens)
    -> std::optional<FactsError> {
    if (tokens.size() != 3) {
        return fail("expected `error <fr> <outlived_fr>`");
    }
    auto fr = expect_region_id(tokens[1], "fr");
    if (is_err(fr)) {
        return unwrap_err(fr);
    }
    auto outlived = expect_region_id(tokens[2], "outlived_fr");
    if (is_err(outlived)) {
        return unwrap_err(outlived);
    }
    violations_.push_back(Violation{RegionVid(unwrap(fr)), RegionVid(unwrap(outlived)), line_});
    return std::nullopt;
}

auto FactsParser::finish() -> Result<FactsProgram, FactsError> {
    const auto n = static_cast<uint32_t>(regions_.size());
    if (n == 0) {
        return FactsError{0, "no regions declared"};
    }
    if (regions_.rbegin()->first != n - 1) {
        uint32_t expected = 0;
        for (const auto& [id, def] : regions_) {
            if (id != expected)
                break;
            ++expected;
        }
        return FactsError{0, "region ids are not dense: region " + std::to_string(expected) +
                                 " is missing"};
    }

    auto known = [n](uint32_t id) { return id < n; };
    for (const auto& [line, c] : constraints_) {
        if (!known(c.sup.index()) || !known(c.sub.index())) {
            return FactsError{line, "constraint mentions an undeclared region"};
        }
    }
    for (const auto& [use, loc] : live_) {
        if (!known(use.region)) {
            return FactsError{use.line, "liveness of undeclared region " +
                                            std::to_string(use.region)};
        }
    }
    for (const auto& v : violations_) {
        if (!known(v.fr.index()) || !known(v.outlived_fr.index())) {
            return FactsError{v.line, "violation mentions an undeclared region"};
        }
    }

    FactsProgram program;
    program.source_path = source_path_;
    program.items.add_item(body_.item, body_.kind);

    for (const auto& opaque : opaques_) {
        if (!known(opaque.region)) {
            return FactsError{opaque.line, "opaque type for undeclared region " +
                                               std::to_string(opaque.region)};
        }
        const auto& external = regions_[opaque.region].external_name;
        if (!external || !external->scope) {
            return FactsError{opaque.line, "region " + std::to_string(opaque.region) +
                                               " is not bound by an item signature"};
        }
        report::OpaqueType type{*external->scope, opaque.span, {}};
        if (opaque.has_static_bound) {
            type.outlives_bounds.push_back(ErrorRegion::static_region());
        }
        program.items.set_return_impl_trait(*external->scope, std::move(type));
    }

    region::RegionFacts facts;
    for (auto& [id, def] : regions_) {
        facts.definitions.push_back(std::move(def));
    }
    for (const auto& [line, c] : constraints_) {
        facts.constraints.push(c);
    }
    facts.liveness.resize(n);
    for (const auto& [use, loc] : live_) {
        facts.liveness.add(RegionVid(use.region), loc);
    }
    if (!scc_.empty()) {
        if (scc_.size() != n) {
            return FactsError{0, "SCC groups given for " + std::to_string(scc_.size()) + " of " +
                                     std::to_string(n) + " regions"};
        }
        std::vector<region::SccId> assignment;
        for (const auto& [id, group] : scc_) {
            if (!known(id)) {
                return FactsError{0, "SCC group for undeclared region " + std::to_string(id)};
            }
            assignment.push_back(group);
        }
        facts.scc_assignment = std::move(assignment);
    }
    facts.body = body_;

    auto context = region::RegionInferenceContext::create(std::move(facts));
    if (is_err(context)) {
        return FactsError{0, unwrap_err(context)};
    }
    program.context = std::move(unwrap(context));
    program.violations = violations_;

    REGIONCK_LOG_INFO("facts", "parsed " << n << " regions, " << constraints_.size()
                                         << " constraints, " << violations_.size()
                                         << " violations");
    return program;
}

} // namespace

auto parse_facts(std::string_view text, diag::SourceMap& source_map, std::string_view default_file)
    -> Result<FactsProgram, FactsError> {
    FactsParser parser(source_map, default_file);
    return parser.parse(text);
}

auto load_facts_file(const std::string& path, diag::SourceMap& source_map)
    -> Result<FactsProgram, FactsError> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return FactsError{0, "cannot open facts file: " + path};
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    REGIONCK_LOG_DEBUG("facts", "read " << path);
    return parse_facts(contents.str(), source_map, path);
}

} // namespace regionck::facts
