//! # CLI Driver Interface
//!
//! This header defines the main entry point for the `basis` tool.
//!
//! ## Entry Points
//!
//! - `basis_main()` configures logging from argv and calls `dispatch()`.
//! - `dispatch()` routes to the command handler named by `args[0]`.

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace basis::cli {

/// Runs the command in `args` (argv without the program name).
int dispatch(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace basis::cli

// Main driver entry point
int basis_main(int argc, char* argv[]);
