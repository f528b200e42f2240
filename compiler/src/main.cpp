//! # regionck Entry Point
//!
//! The binary is named `regionck`. All work happens in the driver
//! (`cli/driver.hpp`).
//!
//! ## Usage
//!
//! ```bash
//! regionck escaping_closure.facts                 # Render diagnostics as text
//! regionck --error-format=json body.facts         # One JSON object per diagnostic
//! regionck --verbose --log-filter=blame=debug f.facts
//! ```

#include "cli/driver.hpp"

/// Main entry point for regionck.
///
/// @return 0 when there is nothing to report, 1 when diagnostics were emitted
///         or the input was rejected, 101 on an internal compiler error
int main(int argc, char* argv[]) {
    return regionck_main(argc, argv);
}
