//! # Driver Interface
//!
//! Entry point of the `regionck` tool: reads a facts file, reports every
//! recorded violation and renders the diagnostics.
//!
//! ## Exit Codes
//!
//! | Code | Meaning                                         |
//! |------|-------------------------------------------------|
//! | 0    | No violations                                   |
//! | 1    | Diagnostics were emitted, or bad input/usage    |
//! | 101  | Internal compiler error                         |

#pragma once

#include "diag/diagnostic.hpp"
#include "diag/source_map.hpp"
#include "facts/facts_parser.hpp"

#include <iosfwd>
#include <string>

namespace regionck::cli {

constexpr int EXIT_DIAGNOSTICS = 1;
constexpr int EXIT_ICE = 101;

/// Reports every violation of `program` into `buffer`.
///
/// With `CheckerOptions::verbose` the blame path of each violation is
/// written to `trace`.
void report_violations(const facts::FactsProgram& program, const diag::SourceMap& source_map,
                       diag::DiagnosticBuffer& buffer, std::ostream& trace);

/// Loads, reports and renders `facts_path`. Returns the exit code.
int run_check(const std::string& facts_path, std::ostream& out);

void print_usage();
void print_version();

} // namespace regionck::cli

// Main driver entry point
int regionck_main(int argc, char* argv[]);
