//! # CLI Command Dispatcher
//!
//! This file implements the main entry point for the `basis` tool. It
//! configures logging and routes to the appropriate command handler.
//!
//! ## Architecture
//!
//! ```text
//! basis_main()
//!   ├─ parse_log_options() → Logger::init()
//!   └─ dispatch()
//!        ├─ exec                → run_exec()
//!        ├─ path / name / dir   → run_locate()
//!        ├─ uid                 → run_uid()
//!        ├─ quote               → run_quote()
//!        ├─ split               → run_split()
//!        ├─ version, -V         → print_version()
//!        └─ help, -h            → print_usage()
//! ```
//!
//! ## Global Flags
//!
//! Logging flags (`--log-level=`, `--log-filter=`, `--log-file=`, `-q`, `-v`)
//! are accepted by every command. For `exec` they are only read before the
//! command to run, so the command's own flags are passed through untouched.

#include "cmd_exec.hpp"
#include "cmd_locate.hpp"
#include "cmd_quote.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <iostream>

namespace basis::cli {

namespace {

int run_version(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    TargetOptions target_options;
    for (size_t i = 0; i < args.size(); ++i) {
        std::string error;
        if (parse_target_option(args, i, target_options, error)) {
            if (!error.empty())
                return report_error(err, error);
            continue;
        }
        if (!is_global_flag(args[i]))
            return report_error(err, "unexpected argument: " + args[i]);
    }

    if (target_options.targets_file.empty())
        return print_version(out, err, nullptr);

    auto loaded = load_targets(target_options);
    if (is_err(loaded))
        return report_error(err, unwrap_err(loaded));
    return print_version(out, err, &unwrap(loaded).project);
}

} // namespace

/// Routes a command line to its handler.
///
/// ## Return Codes
///
/// | Code  | Meaning                                       |
/// |-------|-----------------------------------------------|
/// | 0     | Success                                       |
/// | 1     | Error (usage, lookup, manifest, spawn, ...)   |
/// | other | Exit status of the command run by `exec`      |
int dispatch(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.empty()) {
        print_usage(out);
        return 0;
    }

    const std::string& command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage(out);
        return 0;
    }
    if (command == "version" || command == "--version" || command == "-V") {
        return run_version(rest, out, err);
    }
    if (command == "exec") {
        return run_exec(rest, out, err);
    }
    if (command == "path") {
        return run_locate(LocateQuery::Path, rest, out, err);
    }
    if (command == "name") {
        return run_locate(LocateQuery::Name, rest, out, err);
    }
    if (command == "dir") {
        return run_locate(LocateQuery::Dir, rest, out, err);
    }
    if (command == "uid") {
        return run_uid(rest, out, err);
    }
    if (command == "quote") {
        return run_quote(rest, out);
    }
    if (command == "split") {
        return run_split(rest, out, err);
    }

    // Logging flags may precede the command.
    if (is_global_flag(command)) {
        return dispatch(rest, out, err);
    }

    report_error(err, "unknown command '" + command + "'");
    err << "Run 'basis help' for usage.\n";
    return 1;
}

} // namespace basis::cli

int basis_main(int argc, char* argv[]) {
    using namespace basis;

    std::vector<std::string> args(argv + 1, argv + argc);

    int log_argc = argc;
    if (!args.empty() && args[0] == "exec") {
        std::vector<std::string> rest(args.begin() + 1, args.end());
        log_argc = 2 + static_cast<int>(cli::exec_option_count(rest));
    }
    log::Logger::init(log::parse_log_options(log_argc, argv));
    BASIS_LOG_TRACE("cli", "basis " << VERSION << " started with " << args.size() << " argument(s)");

    int status = cli::dispatch(args, std::cout, std::cerr);
    log::Logger::instance().flush();
    return status;
}
