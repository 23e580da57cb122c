//! # Executable Locator
//!
//! Turns a command name or a build-target name into the absolute path of an
//! executable file.
//!
//! ## Lookup Order
//!
//! 1. No name: the running program itself.
//! 2. A known build target: its registered path, joined against the
//!    registry's base directory, with the `$(IntDir)` build-configuration
//!    placeholder substituted.
//! 3. Anything else: the system PATH.
//!
//! Misses are reported as `std::nullopt`, never as errors.

#ifndef BASIS_EXEC_LOCATOR_HPP
#define BASIS_EXEC_LOCATOR_HPP

#include "target/target_registry.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace basis::exec {

namespace fs = std::filesystem;

/// Placeholder for the active configuration directory of multi-configuration
/// build trees, written into target paths at registry-generation time.
constexpr std::string_view INTDIR_PLACEHOLDER = "$(IntDir)";

/// Configuration directory names tried for `INTDIR_PLACEHOLDER`, in order.
constexpr std::array<std::string_view, 4> BUILD_CONFIGURATIONS = {"Release", "Debug",
                                                                  "RelWithDebInfo", "MinSizeRel"};

/// Absolute, symlink-resolved path of the running program, or std::nullopt
/// if the operating system does not report it.
std::optional<fs::path> current_executable_path();

/// Expands `INTDIR_PLACEHOLDER` in `path` to the first configuration whose
/// result is a regular file, or removes the placeholder if none is.
fs::path substitute_build_configuration(const fs::path& path);

/// Absolute path of the executable named `name`, or std::nullopt if not found.
/// If `name` is std::nullopt, returns the path of the running program.
std::optional<fs::path> exe_path(std::optional<std::string_view> name,
                                 std::string_view prefix = {},
                                 const target::TargetRegistry* targets = nullptr);

/// File name of `exe_path()`. On Windows a ".exe" or ".com" suffix is removed.
std::optional<std::string> exe_name(std::optional<std::string_view> name,
                                    std::string_view prefix = {},
                                    const target::TargetRegistry* targets = nullptr);

/// Directory containing `exe_path()`.
std::optional<fs::path> exe_dir(std::optional<std::string_view> name,
                                std::string_view prefix = {},
                                const target::TargetRegistry* targets = nullptr);

} // namespace basis::exec

#endif // BASIS_EXEC_LOCATOR_HPP
