//! # Process Runner Implementation

#include "exec/executor.hpp"

#include "exec/locator.hpp"
#include "exec/quoting.hpp"
#include "exec/subprocess.hpp"
#include "log/log.hpp"

#include <cctype>

namespace basis::exec {

namespace {

SubprocessError invalid_invocation(std::string message) {
    return SubprocessError{SubprocessErrorKind::InvalidInvocation, std::move(message)};
}

/// Normalizes an invocation into its argument list.
Result<std::vector<std::string>, SubprocessError> to_arguments(const Invocation& invocation) {
    if (const auto* args = std::get_if<std::vector<std::string>>(&invocation)) {
        return *args;
    }
    if (const auto* command_line = std::get_if<std::string>(&invocation)) {
        auto split = qsplit(*command_line);
        if (is_err(split)) {
            return invalid_invocation(unwrap_err(split).message + ": " + *command_line);
        }
        return std::move(unwrap(split));
    }
    return invalid_invocation("No command specified");
}

SubprocessError execution_failed(const std::vector<std::string>& args, const std::string& cause) {
    return SubprocessError{SubprocessErrorKind::ExecutionFailed,
                           "Exception while executing \"" + args[0] + "\"!\n\tArguments: " +
                               to_quoted_string(args) + "\n\t" + cause};
}

} // namespace

// ============================================================================
// Line Sinks
// ============================================================================

void EchoSink::write_line(std::string_view line) {
    size_t end = line.size();
    while (end > 0 && std::isspace(static_cast<unsigned char>(line[end - 1]))) {
        --end;
    }
    out_ << line.substr(0, end) << '\n';
    out_.flush();
}

void CaptureSink::write_line(std::string_view line) {
    text_ += line;
}

// ============================================================================
// execute
// ============================================================================

Result<ExecutionOutcome, SubprocessError> execute(const Invocation& invocation,
                                                  const ExecuteOptions& options) {
    auto normalized = to_arguments(invocation);
    if (is_err(normalized)) {
        return unwrap_err(normalized);
    }
    std::vector<std::string> args = std::move(unwrap(normalized));
    if (args.empty()) {
        return invalid_invocation("No command specified");
    }

    auto resolved = exe_path(args[0], options.prefix, options.targets);
    if (!resolved) {
        return SubprocessError{SubprocessErrorKind::CommandNotFound,
                               args[0] + ": Command not found"};
    }
    args[0] = resolved->string();

    std::ostream& out = options.out ? *options.out : std::cout;
    std::ostream& err = options.err ? *options.err : std::cerr;

    if (options.verbose > 0 || options.simulate) {
        out << "$ " << to_quoted_string(args);
        if (options.simulate) {
            out << " (simulated)";
        }
        out << '\n';
        out.flush();
    }

    ExecutionOutcome outcome;
    if (options.simulate) {
        if (options.capture_stdout) {
            outcome.output = std::string();
        }
        return outcome;
    }

    BASIS_LOG_DEBUG("exec", "running " << to_quoted_string(args));
    auto spawned = ChildProcess::spawn(args);
    if (is_err(spawned)) {
        return SubprocessError{SubprocessErrorKind::SpawnFailed,
                               args[0] + ": " + unwrap_err(spawned).message};
    }
    ChildProcess child = std::move(unwrap(spawned));

    EchoSink echo(out);
    CaptureSink capture;
    std::vector<LineSink*> sinks;
    if (options.capture_stdout) {
        sinks.push_back(&capture);
    }
    if (!options.quiet) {
        sinks.push_back(&echo);
    }

    while (true) {
        auto line = child.read_line();
        if (is_err(line)) {
            return execution_failed(args, unwrap_err(line).message);
        }
        if (!unwrap(line)) {
            break;
        }
        for (LineSink* sink : sinks) {
            sink->write_line(*unwrap(line));
        }
    }

    auto status = child.wait();
    if (is_err(status)) {
        return execution_failed(args, unwrap_err(status).message);
    }
    err << child.stderr_output();
    err.flush();

    outcome.exit_code = unwrap(status);
    BASIS_LOG_DEBUG("exec", args[0] << " exited with status " << outcome.exit_code);

    if (outcome.exit_code != 0 && !options.allow_fail) {
        return SubprocessError{SubprocessErrorKind::NonZeroExit,
                               "** Failed: " + to_quoted_string(args), outcome.exit_code};
    }

    if (options.capture_stdout) {
        outcome.output = capture.take();
    }
    return outcome;
}

std::string_view error_kind_name(SubprocessErrorKind kind) {
    switch (kind) {
    case SubprocessErrorKind::InvalidInvocation:
        return "invalid invocation";
    case SubprocessErrorKind::CommandNotFound:
        return "command not found";
    case SubprocessErrorKind::SpawnFailed:
        return "spawn failed";
    case SubprocessErrorKind::ExecutionFailed:
        return "execution failed";
    case SubprocessErrorKind::NonZeroExit:
        return "non-zero exit";
    }
    return "unknown";
}

} // namespace basis::exec
