//! # PATH Search
//!
//! Locates commands on the system search path, like the `which` shell tool.
//!
//! | Function      | Description                                   |
//! |---------------|-----------------------------------------------|
//! | `which()`     | First matching executable on the search path  |
//! | `which_all()` | Every match, in search-path order             |
//!
//! A name containing a directory separator is checked as given and the search
//! path is not consulted. On Windows, extensions from `PATHEXT` are tried when
//! the name has none.

#ifndef BASIS_EXEC_WHICH_HPP
#define BASIS_EXEC_WHICH_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace basis::exec {

namespace fs = std::filesystem;

/// Why a PATH search produced no result.
enum class WhichErrorKind {
    NotFound,   ///< No executable with that name on the search path
    InvalidName ///< The name is empty
};

struct WhichError {
    WhichErrorKind kind;
    std::string message;
};

/// Separator of entries in the PATH environment variable.
#ifdef _WIN32
constexpr char PATH_LIST_SEPARATOR = ';';
#else
constexpr char PATH_LIST_SEPARATOR = ':';
#endif

/// Returns the value of the PATH environment variable, or "" if unset.
std::string system_search_path();

/// Splits a PATH-style list. Empty entries denote the current directory.
std::vector<fs::path> split_search_path(std::string_view search_path);

/// Whether `path` is a regular file the current user may execute.
bool is_executable_file(const fs::path& path);

/// Absolute path of the first executable named `name` on the system PATH.
Result<fs::path, WhichError> which(std::string_view name);

/// Absolute path of the first executable named `name` on `search_path`.
Result<fs::path, WhichError> which(std::string_view name, std::string_view search_path);

/// All executables named `name` on the system PATH, without duplicates.
std::vector<fs::path> which_all(std::string_view name);

/// All executables named `name` on `search_path`, without duplicates.
std::vector<fs::path> which_all(std::string_view name, std::string_view search_path);

} // namespace basis::exec

#endif // BASIS_EXEC_WHICH_HPP
