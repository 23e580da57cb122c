//! # Command Line Quoting
//!
//! Converts between argument lists and single-string command lines.
//!
//! `to_quoted_string()` produces the rendering used in verbose output and
//! error messages: double quotes around arguments that contain a single
//! quote or whitespace or are empty, `\"` for embedded double quotes, one
//! space between arguments.
//!
//! `qsplit()` splits a command line with POSIX shell rules.

#ifndef BASIS_EXEC_QUOTING_HPP
#define BASIS_EXEC_QUOTING_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace basis::exec {

/// Joins `args` into one double-quoted command line string.
std::string to_quoted_string(const std::vector<std::string>& args);

/// Error produced by qsplit() for malformed command lines.
struct SplitError {
    std::string message;
};

/// Splits a quoted command line into arguments.
///
/// - Unquoted whitespace separates arguments.
/// - '...' preserves its content literally.
/// - "..." preserves its content; a backslash escapes only `"` and `\`.
/// - Outside quotes a backslash escapes the next character.
/// - Adjacent quoted and unquoted pieces form one argument.
Result<std::vector<std::string>, SplitError> qsplit(std::string_view command_line);

} // namespace basis::exec

#endif // BASIS_EXEC_QUOTING_HPP
