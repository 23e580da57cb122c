#include "cmd_locate.hpp"

#include "exec/locator.hpp"
#include "log/log.hpp"
#include "utils.hpp"

#include <optional>

namespace basis::cli {

namespace {

struct LocateCommandLine {
    std::optional<std::string> name;
    TargetOptions target_options;
};

Result<LocateCommandLine, std::string> parse_locate_args(const std::vector<std::string>& args) {
    LocateCommandLine parsed;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        std::string error;
        if (parse_target_option(args, i, parsed.target_options, error)) {
            if (!error.empty())
                return error;
            continue;
        }
        if (is_global_flag(arg))
            continue;
        if (arg.size() > 1 && arg[0] == '-')
            return "unknown option: " + arg;
        if (parsed.name)
            return "unexpected argument: " + arg;
        parsed.name = arg;
    }
    return parsed;
}

/// Loads the manifest if one was named. Returns false after reporting an error.
bool load_manifest(const TargetOptions& options, std::optional<target::TargetManifest>& manifest,
                   std::ostream& err) {
    if (options.targets_file.empty())
        return true;
    auto loaded = load_targets(options);
    if (is_err(loaded)) {
        report_error(err, unwrap_err(loaded));
        return false;
    }
    manifest = std::move(unwrap(loaded));
    return true;
}

} // namespace

int run_locate(LocateQuery query, const std::vector<std::string>& args, std::ostream& out,
               std::ostream& err) {
    auto parsed_result = parse_locate_args(args);
    if (is_err(parsed_result))
        return report_error(err, unwrap_err(parsed_result));
    const LocateCommandLine& parsed = unwrap(parsed_result);

    std::optional<target::TargetManifest> manifest;
    if (!load_manifest(parsed.target_options, manifest, err))
        return 1;

    std::string prefix = effective_prefix(parsed.target_options, manifest ? &*manifest : nullptr);
    const target::TargetRegistry* targets = manifest ? &manifest->targets : nullptr;
    std::optional<std::string_view> name;
    if (parsed.name)
        name = *parsed.name;

    std::optional<std::string> result;
    switch (query) {
    case LocateQuery::Path:
        if (auto path = exec::exe_path(name, prefix, targets))
            result = path->string();
        break;
    case LocateQuery::Name:
        result = exec::exe_name(name, prefix, targets);
        break;
    case LocateQuery::Dir:
        if (auto dir = exec::exe_dir(name, prefix, targets))
            result = dir->string();
        break;
    }

    if (!result) {
        return report_error(err, "cannot locate '" + parsed.name.value_or("basis") + "'");
    }
    out << *result << '\n';
    return 0;
}

int run_uid(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto parsed_result = parse_locate_args(args);
    if (is_err(parsed_result))
        return report_error(err, unwrap_err(parsed_result));
    const LocateCommandLine& parsed = unwrap(parsed_result);
    if (!parsed.name) {
        err << "Usage: basis uid <name> [--targets FILE] [--prefix P]\n";
        return 1;
    }

    std::optional<target::TargetManifest> manifest;
    if (!load_manifest(parsed.target_options, manifest, err))
        return 1;

    std::string prefix = effective_prefix(parsed.target_options, manifest ? &*manifest : nullptr);
    auto uid = target::target_uid(*parsed.name, prefix, manifest ? &manifest->targets : nullptr);
    if (!uid)
        return report_error(err, "invalid target name '" + *parsed.name + "'");

    BASIS_LOG_DEBUG("cli", *parsed.name << " -> " << *uid);
    out << *uid << '\n';
    return 0;
}

} // namespace basis::cli
