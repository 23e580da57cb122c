#include "utils.hpp"

#include "common.hpp"
#include "exec/banner.hpp"
#include "log/log.hpp"

namespace basis::cli {

void print_usage(std::ostream& out) {
    out << "BASIS executable utilities " << VERSION << "\n\n";
    out << "Usage: basis <command> [options] [args]\n\n";
    out << "Commands:\n";
    out << "  exec      Run a command, echoing or capturing its output\n";
    out << "  path      Print the absolute path of an executable\n";
    out << "  name      Print the file name of an executable\n";
    out << "  dir       Print the directory of an executable\n";
    out << "  uid       Print the fully qualified identifier of a build target\n";
    out << "  quote     Join arguments into a quoted command line\n";
    out << "  split     Split a quoted command line into arguments\n";
    out << "  version   Show version information\n";
    out << "  help      Show this help\n";
    out << "\nExec options:\n";
    out << "  --quiet            Do not echo the command's output\n";
    out << "  --allow-fail       Exit with the command's status without an error\n";
    out << "  --simulate         Print the command line instead of running it\n";
    out << "  --verbose, -v      Print the command line before running it\n";
    out << "  --command <line>   Run a quoted command line\n";
    out << "\nTarget options (exec, path, name, dir, uid, version):\n";
    out << "  --targets <file>   Target manifest (TOML) listing build targets\n";
    out << "  --prefix <ns>      Namespace of the calling project\n";
    out << "\nLogging options:\n";
    out << "  --log-level=<lvl>  trace, debug, info, warn, error, fatal, off\n";
    out << "  --log-filter=<f>   Per-module levels, e.g. \"exec=debug,*=warn\"\n";
    out << "  --log-file=<path>  Also write log records to a file\n";
    out << "  -q, -v, -vv, -vvv  Quieter or more verbose logging\n";
    out << "\nThe BASIS_LOG environment variable sets the level or filter when no\n";
    out << "logging option is given.\n";
}

int print_version(std::ostream& out, std::ostream& err, const target::ProjectInfo* project) {
    exec::ProgramInfo info;
    if (project) {
        info.name = project->name;
        info.version = project->version;
        info.copyright = project->copyright;
        info.license = project->license;
        info.contact = project->contact;
    } else {
        info.name = "basis";
        info.version = VERSION;
        info.project = "BASIS";
    }

    if (!exec::print_version(out, info)) {
        return report_error(err, "no version set for '" + info.name + "'");
    }
    if (!info.contact.empty()) {
        out << '\n';
        exec::print_contact(out, info.contact);
    }
    return 0;
}

bool is_global_flag(std::string_view arg) {
    if (log::is_log_option(arg) || arg == "-q" || arg == "--quiet" || arg == "--verbose")
        return true;
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return false;
    return arg.find_first_not_of('v', 1) == std::string_view::npos;
}

bool parse_target_option(const std::vector<std::string>& args, size_t& i, TargetOptions& options,
                         std::string& error) {
    const std::string& arg = args[i];

    auto take_value = [&](std::string_view flag) -> std::optional<std::string> {
        if (arg.size() > flag.size() && arg.starts_with(flag) && arg[flag.size()] == '=')
            return arg.substr(flag.size() + 1);
        if (arg != flag)
            return std::nullopt;
        if (i + 1 >= args.size()) {
            error = "option " + std::string(flag) + " requires a value";
            return std::nullopt;
        }
        return args[++i];
    };

    if (arg.starts_with("--targets")) {
        if (auto value = take_value("--targets")) {
            options.targets_file = *value;
            return true;
        }
        return !error.empty();
    }
    if (arg.starts_with("--prefix")) {
        if (auto value = take_value("--prefix")) {
            options.prefix = *value;
            return true;
        }
        return !error.empty();
    }
    return false;
}

Result<target::TargetManifest, std::string> load_targets(const TargetOptions& options) {
    BASIS_LOG_DEBUG("cli", "loading targets from " << options.targets_file);
    return target::TargetManifest::load(options.targets_file);
}

std::string effective_prefix(const TargetOptions& options, const target::TargetManifest* manifest) {
    if (options.prefix)
        return *options.prefix;
    if (manifest)
        return manifest->project.prefix;
    return {};
}

int report_error(std::ostream& err, std::string_view message) {
    err << "error: " << message << '\n';
    return 1;
}

} // namespace basis::cli
