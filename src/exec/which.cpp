//! # PATH Search Implementation

#include "exec/which.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <system_error>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace basis::exec {

namespace {

bool has_directory_part(std::string_view name) {
#ifdef _WIN32
    return name.find_first_of("/\\") != std::string_view::npos;
#else
    return name.find('/') != std::string_view::npos;
#endif
}

#ifdef _WIN32
std::vector<std::string> executable_extensions() {
    const char* env = std::getenv("PATHEXT");
    std::string_view pathext = env ? env : ".COM;.EXE;.BAT;.CMD";
    std::vector<std::string> exts;
    size_t pos = 0;
    while (pos <= pathext.size()) {
        size_t semi = pathext.find(';', pos);
        if (semi == std::string_view::npos)
            semi = pathext.size();
        if (semi > pos)
            exts.emplace_back(pathext.substr(pos, semi - pos));
        pos = semi + 1;
    }
    return exts;
}
#endif

/// File names to probe for `name`, in preference order.
std::vector<std::string> candidate_names(std::string_view name) {
    std::vector<std::string> names;
#ifdef _WIN32
    if (fs::path(name).has_extension()) {
        names.emplace_back(name);
        return names;
    }
    for (const auto& ext : executable_extensions()) {
        names.push_back(std::string(name) + ext);
    }
#endif
    names.emplace_back(name);
    return names;
}

fs::path absolute_normal(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    return ec ? path.lexically_normal() : abs.lexically_normal();
}

std::vector<fs::path> search(std::string_view name, std::string_view search_path, bool all) {
    std::vector<fs::path> found;

    if (has_directory_part(name)) {
        for (const auto& candidate : candidate_names(name)) {
            if (is_executable_file(candidate)) {
                found.push_back(absolute_normal(candidate));
                break;
            }
        }
        return found;
    }

    for (const auto& dir : split_search_path(search_path)) {
        for (const auto& candidate : candidate_names(name)) {
            fs::path path = absolute_normal(dir / candidate);
            if (!is_executable_file(path))
                continue;
            if (std::find(found.begin(), found.end(), path) != found.end())
                continue;
            BASIS_LOG_TRACE("which", name << " -> " << path.string());
            found.push_back(std::move(path));
            if (!all)
                return found;
        }
    }
    return found;
}

} // namespace

std::string system_search_path() {
    const char* path = std::getenv("PATH");
    return path ? path : "";
}

std::vector<fs::path> split_search_path(std::string_view search_path) {
    std::vector<fs::path> dirs;
    if (search_path.empty())
        return dirs;

    size_t pos = 0;
    while (true) {
        size_t sep = search_path.find(PATH_LIST_SEPARATOR, pos);
        std::string_view entry = search_path.substr(
            pos, sep == std::string_view::npos ? std::string_view::npos : sep - pos);
        dirs.emplace_back(entry.empty() ? fs::path(".") : fs::path(entry));
        if (sep == std::string_view::npos)
            break;
        pos = sep + 1;
    }
    return dirs;
}

bool is_executable_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
        return false;
#ifdef _WIN32
    return true;
#else
    return ::access(path.c_str(), X_OK) == 0;
#endif
}

Result<fs::path, WhichError> which(std::string_view name) {
    return which(name, system_search_path());
}

Result<fs::path, WhichError> which(std::string_view name, std::string_view search_path) {
    if (name.empty()) {
        return WhichError{WhichErrorKind::InvalidName, "Cannot search for an empty command name."};
    }
    auto found = search(name, search_path, false);
    if (found.empty()) {
        return WhichError{WhichErrorKind::NotFound,
                          "Could not find '" + std::string(name) + "' on the path."};
    }
    return found.front();
}

std::vector<fs::path> which_all(std::string_view name) {
    return which_all(name, system_search_path());
}

std::vector<fs::path> which_all(std::string_view name, std::string_view search_path) {
    if (name.empty())
        return {};
    return search(name, search_path, true);
}

} // namespace basis::exec
