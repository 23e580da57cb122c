//! # basis Entry Point
//!
//! The `basis` tool exposes the executable utilities on the command line:
//! locating executables and build targets, quoting command lines and running
//! commands.
//!
//! ## Usage
//!
//! ```bash
//! basis exec -v -- cmake --build .        # Print, then run a command
//! basis path cmake                        # Absolute path of a command
//! basis path tool --targets targets.toml  # Absolute path of a build target
//! basis split "a 'b c'"                   # Split a quoted command line
//! ```
//!
//! All functionality lives in the CLI driver (`cli/driver.hpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return basis_main(argc, argv);
}
