//! # Exec Command
//!
//! Runs a command through the process runner. Build targets named in a
//! target manifest (`--targets`) are resolved before the PATH.
//!
//! ## Exit Status
//!
//! | Situation                         | Status                  |
//! |-----------------------------------|-------------------------|
//! | Command ran                       | Its exit status         |
//! | Command failed, no `--allow-fail` | Its exit status + error |
//! | Anything else went wrong          | 1                       |

#include "cmd_exec.hpp"

#include "exec/executor.hpp"
#include "log/log.hpp"

namespace basis::cli {

Result<ExecCommandLine, std::string> parse_exec_args(const std::vector<std::string>& args) {
    ExecCommandLine parsed;
    size_t i = 0;

    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "--quiet") {
            parsed.quiet = true;
        } else if (arg == "--allow-fail") {
            parsed.allow_fail = true;
        } else if (arg == "--simulate") {
            parsed.simulate = true;
        } else if (arg == "--verbose") {
            ++parsed.verbose;
        } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v' &&
                   arg.find_first_not_of('v', 1) == std::string::npos) {
            parsed.verbose += static_cast<int>(arg.size() - 1);
        } else if (arg == "--command") {
            if (i + 1 >= args.size())
                return std::string("option --command requires a value");
            parsed.command_line = args[++i];
        } else if (arg.starts_with("--command=")) {
            parsed.command_line = arg.substr(10);
        } else if (is_global_flag(arg)) {
            continue;
        } else {
            std::string error;
            if (parse_target_option(args, i, parsed.target_options, error)) {
                if (!error.empty())
                    return error;
                continue;
            }
            if (arg.starts_with("-"))
                return "unknown option for exec: " + arg;
            break;
        }
    }

    parsed.option_count = i;
    parsed.command.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());

    if (parsed.command_line && !parsed.command.empty())
        return std::string("--command cannot be combined with a command argument list");
    if (!parsed.command_line && parsed.command.empty())
        return std::string("no command given");
    return parsed;
}

size_t exec_option_count(const std::vector<std::string>& args) {
    auto parsed = parse_exec_args(args);
    if (is_err(parsed))
        return args.size();
    return unwrap(parsed).option_count;
}

int run_exec(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed_result = parse_exec_args(args);
    if (is_err(parsed_result)) {
        err << "Usage: basis exec [options] [--] <command> [args...]\n";
        return report_error(err, unwrap_err(parsed_result));
    }
    const ExecCommandLine& parsed = unwrap(parsed_result);

    std::optional<target::TargetManifest> manifest;
    if (!parsed.target_options.targets_file.empty()) {
        auto loaded = load_targets(parsed.target_options);
        if (is_err(loaded))
            return report_error(err, unwrap_err(loaded));
        manifest = std::move(unwrap(loaded));
    }

    exec::ExecuteOptions options;
    options.quiet = parsed.quiet;
    options.allow_fail = parsed.allow_fail;
    options.simulate = parsed.simulate;
    options.verbose = parsed.verbose;
    options.prefix = effective_prefix(parsed.target_options, manifest ? &*manifest : nullptr);
    options.targets = manifest ? &manifest->targets : nullptr;
    options.out = &out;
    options.err = &err;

    exec::Invocation invocation;
    if (parsed.command_line) {
        invocation = *parsed.command_line;
    } else {
        invocation = parsed.command;
    }

    auto result = exec::execute(invocation, options);
    if (is_err(result)) {
        const auto& error = unwrap_err(result);
        BASIS_LOG_DEBUG("cli", "exec failed: " << exec::error_kind_name(error.kind));
        report_error(err, error.message);
        if (error.kind == exec::SubprocessErrorKind::NonZeroExit)
            return error.exit_code;
        return 1;
    }
    return unwrap(result).exit_code;
}

} // namespace basis::cli
