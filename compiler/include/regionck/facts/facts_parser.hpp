//! # Facts Files
//!
//! Textual description of a solved body: its regions, outlives constraints,
//! liveness, span table and the violations to explain. The `regionck` driver
//! reads one facts file per run.
//!
//! ## Format
//!
//! One directive per line; `#` starts a comment.
//!
//! ```text
//! source src/lib.rs
//! item closure main::{closure#0} 3:29-5:6
//! region 0 static
//! region 1 external var=f@2:13-2:18
//! region 2 local var=x@3:30-3:31
//! outlives 2 1 assignment all 4:9-4:20
//! outlives 1 3 boring at 0:2
//! point 0:2 4:9-4:20
//! live 3 0:2
//! scc 3 1
//! opaque 1 1:30-1:51 static
//! error 2 1
//! ```
//!
//! Spans are `line:col-line:col` in the file named by `source` (end column
//! exclusive). Locations are `block:statement`. Region ids are dense from 0
//! and exactly one region is `static`.

#ifndef REGIONCK_FACTS_FACTS_PARSER_HPP
#define REGIONCK_FACTS_FACTS_PARSER_HPP

#include "common.hpp"
#include "diag/source_map.hpp"
#include "region/region_context.hpp"
#include "report/collaborators.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace regionck::facts {

using region::RegionVid;

/// A requirement `fr: outlived_fr` the solver could not prove.
struct Violation {
    RegionVid fr;
    RegionVid outlived_fr;

    /// Line of the `error` directive.
    uint32_t line = 0;
};

/// A parsed facts file, ready to be reported on.
struct FactsProgram {
    /// Path given by the `source` directive; empty if there was none.
    std::string source_path;

    Box<region::RegionInferenceContext> context;
    report::TableItemContext items;
    std::vector<Violation> violations;
};

struct FactsError {
    /// 1-based line of the offending directive; 0 for whole-file problems.
    uint32_t line = 0;
    std::string message;
};

auto operator<<(std::ostream& os, const FactsError& error) -> std::ostream&;

/// Parses `text`.
///
/// Span file names are interned in `source_map`. Spans that appear before a
/// `source` directive refer to `default_file`. Source contents are not read.
[[nodiscard]] auto parse_facts(std::string_view text, diag::SourceMap& source_map,
                               std::string_view default_file = "<facts>")
    -> Result<FactsProgram, FactsError>;

/// Reads and parses the facts file at `path`.
[[nodiscard]] auto load_facts_file(const std::string& path, diag::SourceMap& source_map)
    -> Result<FactsProgram, FactsError>;

} // namespace regionck::facts

#endif // REGIONCK_FACTS_FACTS_PARSER_HPP
