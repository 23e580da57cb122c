//! # Process Runner
//!
//! Runs an external command, echoing and/or capturing its standard output.
//!
//! ## Pipeline
//!
//! ```text
//! Invocation ──> argument list ──> exe_path(args[0]) ──> spawn ──> line loop
//!   (argv or quoted string)          (targets, PATH)                 │
//!                                                          EchoSink / CaptureSink
//! ```
//!
//! ## Errors
//!
//! | Kind                | Raised when                                     |
//! |---------------------|-------------------------------------------------|
//! | `InvalidInvocation` | no invocation, empty argv, unbalanced quoting   |
//! | `CommandNotFound`   | the command does not resolve (any `allow_fail`) |
//! | `SpawnFailed`       | the OS refused to start the child               |
//! | `ExecutionFailed`   | reading output or waiting failed                |
//! | `NonZeroExit`       | the child failed and `allow_fail` is false      |

#ifndef BASIS_EXEC_EXECUTOR_HPP
#define BASIS_EXEC_EXECUTOR_HPP

#include "common.hpp"
#include "target/target_registry.hpp"

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace basis::exec {

/// A command to run: nothing, an argument list whose first element is the
/// command, or a single command line split with qsplit().
using Invocation = std::variant<std::monostate, std::vector<std::string>, std::string>;

/// Builds an argument list from arbitrary streamable values.
///
/// ```cpp
/// execute(make_args("cmake", "--build", dir, "-j", 4), options);
/// ```
template <typename... Args> std::vector<std::string> make_args(const Args&... values) {
    std::vector<std::string> args;
    args.reserve(sizeof...(values));
    auto append = [&args](const auto& value) {
        std::ostringstream oss;
        oss << value;
        args.push_back(oss.str());
    };
    (append(values), ...);
    return args;
}

struct ExecuteOptions {
    bool quiet = false;          ///< Do not echo the child's standard output.
    bool capture_stdout = false; ///< Return the child's standard output.
    bool allow_fail = false;     ///< A non-zero exit status is not an error.
    int verbose = 0;             ///< Print the command line before running it.
    bool simulate = false;       ///< Print the command line, never run it.
    std::string prefix;          ///< Namespace of the calling project.
    const target::TargetRegistry* targets = nullptr;
    std::ostream* out = &std::cout; ///< Echo stream.
    std::ostream* err = &std::cerr; ///< Receives the child's standard error.
};

struct ExecutionOutcome {
    int exit_code = 0;
    std::optional<std::string> output; ///< Set only when capture_stdout was requested.
};

enum class SubprocessErrorKind {
    InvalidInvocation,
    CommandNotFound,
    SpawnFailed,
    ExecutionFailed,
    NonZeroExit,
};

struct SubprocessError {
    SubprocessErrorKind kind;
    std::string message;
    int exit_code = 0; ///< Exit status of the child for NonZeroExit.
};

/// Receiver for the lines a child writes to its standard output.
class LineSink {
public:
    virtual ~LineSink() = default;
    virtual void write_line(std::string_view line) = 0;
};

/// Writes each line to a stream with trailing whitespace replaced by a
/// single newline, flushing after every line.
class EchoSink : public LineSink {
public:
    explicit EchoSink(std::ostream& out) : out_(out) {}
    void write_line(std::string_view line) override;

private:
    std::ostream& out_;
};

/// Appends every line verbatim.
class CaptureSink : public LineSink {
public:
    void write_line(std::string_view line) override;
    const std::string& text() const {
        return text_;
    }
    std::string take() {
        return std::move(text_);
    }

private:
    std::string text_;
};

/// Runs `invocation` and waits for it to finish.
Result<ExecutionOutcome, SubprocessError> execute(const Invocation& invocation,
                                                  const ExecuteOptions& options = {});

/// Short name of an error kind, for diagnostics.
std::string_view error_kind_name(SubprocessErrorKind kind);

} // namespace basis::exec

#endif // BASIS_EXEC_EXECUTOR_HPP
