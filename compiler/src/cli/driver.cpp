//! # Driver
//!
//! ```text
//! regionck_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   └─ <facts-file>   → run_check()
//!                         ├─ load_facts_file()
//!                         ├─ SourceMap::load_file()
//!                         ├─ report_violations()
//!                         └─ DiagnosticEmitter::emit_all()
//! ```
//!
//! Logging options (`--log-level=`, `-v`, ...) are consumed by
//! `log::parse_log_options` and ignored here.

#include "cli/driver.hpp"

#include "diag/emitter.hpp"
#include "log/log.hpp"
#include "report/region_error_reporter.hpp"

#include <iostream>
#include <string>
#include <vector>

namespace regionck::cli {

using region::RegionVid;

void print_usage() {
    std::cout << "regionck " << VERSION << "\n\n";
    std::cout << "Usage: regionck [options] <facts-file>\n\n";
    std::cout << "Explains violated lifetime constraints recorded in a facts file.\n\n";
    std::cout << "Options:\n";
    std::cout << "  --error-format=json|text  Diagnostic output format (default: text)\n";
    std::cout << "  --color=auto|always|never Colorize text diagnostics (default: auto)\n";
    std::cout << "  --verbose                 Print the blame path of every violation\n";
    std::cout << "  --log-level=<level>       trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>       Per-module levels, e.g. blame=trace,*=warn\n";
    std::cout << "  --log-file=<path>         Also write logs to a file\n";
    std::cout << "  --log-format=text|json    Log line format\n";
    std::cout << "  -v, -vv, -vvv, -q         Shorthand log levels\n";
    std::cout << "  -h, --help                Show this message\n";
    std::cout << "  -V, --version             Show version\n";
}

void print_version() {
    std::cout << "regionck " << VERSION << "\n";
}

void report_violations(const facts::FactsProgram& program, const diag::SourceMap& source_map,
                       diag::DiagnosticBuffer& buffer, std::ostream& trace) {
    const auto& ctx = *program.context;
    report::ContextRegionNamer namer(ctx);
    report::DeclineNiceRegionErrors nice;
    report::RegionErrorReporter reporter(ctx, program.items, namer, nice, source_map);

    for (const auto& violation : program.violations) {
        RegionVid outlived_fr = violation.outlived_fr;

        if (CheckerOptions::verbose) {
            auto path = reporter.selector().path_finder().find_path(
                violation.fr, [outlived_fr](RegionVid r) { return r == outlived_fr; });
            trace << "note: blame path for `" << violation.fr << ": " << outlived_fr << "`\n";
            if (path) {
                for (const auto& c : path->constraints) {
                    trace << "  " << c << " at " << ctx.span_of(c.locations) << "\n";
                }
            }
        }

        auto shape = reporter.report_error(violation.fr, outlived_fr, buffer);
        REGIONCK_LOG_INFO("driver", "violation on line " << violation.line << " reported as "
                                                         << report::report_shape_name(shape));
    }
}

int run_check(const std::string& facts_path, std::ostream& out) {
    diag::SourceMap source_map;

    auto parsed = facts::load_facts_file(facts_path, source_map);
    if (is_err(parsed)) {
        out << "error: " << facts_path << ": " << unwrap_err(parsed) << "\n";
        return EXIT_DIAGNOSTICS;
    }
    auto& program = unwrap(parsed);

    if (!program.source_path.empty()) {
        auto loaded = source_map.load_file(program.source_path);
        if (is_err(loaded)) {
            // Diagnostics still render, just without snippets.
            REGIONCK_LOG_WARN("driver", unwrap_err(loaded));
        }
    }

    diag::DiagnosticBuffer buffer;
    report_violations(program, source_map, buffer, out);

    diag::DiagnosticEmitter emitter(source_map, out);
    emitter.set_format(CheckerOptions::diagnostic_format);
    emitter.set_color_enabled(CheckerOptions::diagnostic_format == DiagnosticFormat::Text &&
                              diag::colors_enabled());
    emitter.emit_all(buffer);

    if (emitter.error_count() > 0) {
        if (CheckerOptions::diagnostic_format == DiagnosticFormat::Text) {
            out << "error: aborting due to " << emitter.error_count()
                << (emitter.error_count() == 1 ? " previous error" : " previous errors") << "\n";
        }
        return EXIT_DIAGNOSTICS;
    }
    return 0;
}

} // namespace regionck::cli

int regionck_main(int argc, char* argv[]) {
    using namespace regionck;

    log::Logger::init(log::parse_log_options(argc, argv));

    std::vector<std::string> inputs;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            cli::print_usage();
            return 0;
        }
        if (arg == "--version" || arg == "-V") {
            cli::print_version();
            return 0;
        }

        if (arg.starts_with("--error-format=")) {
            std::string format = arg.substr(15);
            if (format == "json") {
                CheckerOptions::diagnostic_format = DiagnosticFormat::JSON;
            } else if (format == "text") {
                CheckerOptions::diagnostic_format = DiagnosticFormat::Text;
            } else {
                std::cerr << "error: unknown error format '" << format << "'\n";
                return cli::EXIT_DIAGNOSTICS;
            }
        } else if (arg.starts_with("--color=")) {
            std::string choice = arg.substr(8);
            if (choice == "auto") {
                CheckerOptions::color = ColorChoice::Auto;
            } else if (choice == "always") {
                CheckerOptions::color = ColorChoice::Always;
            } else if (choice == "never") {
                CheckerOptions::color = ColorChoice::Never;
            } else {
                std::cerr << "error: unknown color choice '" << choice << "'\n";
                return cli::EXIT_DIAGNOSTICS;
            }
        } else if (arg == "--verbose") {
            CheckerOptions::verbose = true;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (arg.starts_with("-")) {
            std::cerr << "error: unknown option '" << arg << "'\n";
            return cli::EXIT_DIAGNOSTICS;
        } else {
            inputs.push_back(arg);
        }
    }

    if (inputs.size() != 1) {
        std::cerr << "Usage: regionck [options] <facts-file>\n";
        return cli::EXIT_DIAGNOSTICS;
    }

    try {
        return cli::run_check(inputs[0], std::cerr);
    } catch (const InternalCompilerError& e) {
        log::Logger::instance().flush();
        std::cerr << "internal compiler error: " << e.what() << "\n";
        return cli::EXIT_ICE;
    }
}
