//! # CLI Utilities Interface
//!
//! This header defines shared utility functions for the CLI.
//!
//! ## Functions
//!
//! | Function              | Description                                  |
//! |-----------------------|----------------------------------------------|
//! | `print_usage()`       | Print CLI help text                          |
//! | `print_version()`     | Print the banner of basis or of a project    |
//! | `is_global_flag()`    | Logging flags accepted by every command      |
//! | `load_targets()`      | Load a target manifest named on the CLI      |
//! | `report_error()`      | Print "error: <message>" and return 1        |

#pragma once

#include "target/target_manifest.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace basis::cli {

/// Options shared by commands that resolve names through a target manifest.
struct TargetOptions {
    std::string targets_file;
    std::optional<std::string> prefix;
};

// Help text
void print_usage(std::ostream& out);
int print_version(std::ostream& out, std::ostream& err, const target::ProjectInfo* project);

// Option handling
bool is_global_flag(std::string_view arg);

/// Consumes `--targets FILE`, `--targets=FILE`, `--prefix P` and `--prefix=P`
/// at `args[i]`, advancing `i` past a separate value. Returns false if
/// `args[i]` is not one of them; sets `error` if the value is missing.
bool parse_target_option(const std::vector<std::string>& args, size_t& i, TargetOptions& options,
                         std::string& error);

/// Loads the manifest named by `options.targets_file`.
Result<target::TargetManifest, std::string> load_targets(const TargetOptions& options);

/// The prefix given on the command line, else the manifest's project prefix.
std::string effective_prefix(const TargetOptions& options, const target::TargetManifest* manifest);

int report_error(std::ostream& err, std::string_view message);

} // namespace basis::cli
