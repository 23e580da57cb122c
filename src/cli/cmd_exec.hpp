//! # Exec Command Interface
//!
//! `basis exec [options] [--] <command> [args...]`
//! `basis exec [options] --command "<quoted command line>"`

#pragma once

#include "utils.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace basis::cli {

/// Parsed `exec` arguments.
struct ExecCommandLine {
    bool quiet = false;
    bool allow_fail = false;
    bool simulate = false;
    int verbose = 0;
    TargetOptions target_options;
    std::optional<std::string> command_line;
    std::vector<std::string> command;
    size_t option_count = 0; ///< Arguments consumed before the command.
};

/// Parses the arguments following `exec`. The first non-option argument, or
/// the argument after `--`, starts the command.
Result<ExecCommandLine, std::string> parse_exec_args(const std::vector<std::string>& args);

/// Number of leading arguments that are options of `exec` itself. Logging
/// options are only read from this part of the command line.
size_t exec_option_count(const std::vector<std::string>& args);

/// Runs `basis exec`. Returns the child's exit status, or 1 on error.
int run_exec(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace basis::cli
