//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the BASIS_LOG
//! environment variable into a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace basis::log {

namespace {

/// Counts the 'v' characters of a "-v", "-vv", "-vvv" flag; 0 for anything else.
int verbose_flag_count(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return 0;
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v')
            return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=");
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        // Everything after "--" belongs to the child command.
        if (arg == "--")
            break;

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            v_count = std::max(v_count, 1);
        } else {
            v_count = std::max(v_count, verbose_flag_count(arg));
        }
    }

    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("BASIS_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "module=level,..." or "mod1,mod2" is a filter, otherwise a level
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace basis::log
