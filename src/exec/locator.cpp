//! # Executable Locator Implementation
//!
//! Resolves build targets through the target registry and everything else
//! through the PATH search.

#include "exec/locator.hpp"

#include "exec/which.hpp"
#include "log/log.hpp"

#include <cctype>
#include <system_error>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <vector>
#endif

namespace basis::exec {

namespace {

std::string replace_all(std::string text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

fs::path make_absolute(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    return (ec ? path : abs).lexically_normal();
}

/// Directory that relative target paths are joined against.
fs::path registry_base_dir(const target::TargetRegistry& targets) {
    if (!targets.base_dir().empty())
        return targets.base_dir();
    if (auto self = current_executable_path())
        return self->parent_path();
    std::error_code ec;
    return fs::current_path(ec);
}

std::optional<fs::path> locate_target(std::string_view name, std::string_view prefix,
                                      const target::TargetRegistry& targets) {
    auto stored = target::target_path(name, prefix, &targets);
    if (!stored)
        return std::nullopt;

    fs::path path = make_absolute(registry_base_dir(targets) / fs::path(*stored));
    if (path.string().find(INTDIR_PLACEHOLDER) != std::string::npos) {
        path = substitute_build_configuration(path);
    }
    BASIS_LOG_DEBUG("locate", "target '" << name << "' -> " << path.string());
    return path;
}

std::optional<fs::path> locate_command(std::string_view name) {
    auto found = which(name);
    if (is_err(found)) {
        const auto& error = unwrap_err(found);
        if (error.kind == WhichErrorKind::NotFound) {
            BASIS_LOG_DEBUG("locate", error.message);
        } else {
            BASIS_LOG_WARN("locate", error.message);
        }
        return std::nullopt;
    }
    BASIS_LOG_DEBUG("locate", "command '" << name << "' -> " << unwrap(found).string());
    return unwrap(found);
}

} // namespace

std::optional<fs::path> current_executable_path() {
    std::error_code ec;
#ifdef _WIN32
    std::wstring buffer(MAX_PATH, L'\0');
    while (true) {
        DWORD length = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (length == 0) {
            BASIS_LOG_ERROR("locate", "GetModuleFileNameW failed: " << GetLastError());
            return std::nullopt;
        }
        if (length < buffer.size()) {
            buffer.resize(length);
            break;
        }
        buffer.resize(buffer.size() * 2);
    }
    fs::path self(buffer);
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::vector<char> buffer(size + 1, '\0');
    if (_NSGetExecutablePath(buffer.data(), &size) != 0) {
        BASIS_LOG_ERROR("locate", "_NSGetExecutablePath failed");
        return std::nullopt;
    }
    fs::path self(buffer.data());
#else
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        BASIS_LOG_ERROR("locate", "cannot read /proc/self/exe: " << ec.message());
        return std::nullopt;
    }
#endif
    fs::path resolved = fs::weakly_canonical(self, ec);
    return ec ? make_absolute(self) : resolved;
}

fs::path substitute_build_configuration(const fs::path& path) {
    const std::string templated = path.string();
    for (std::string_view config : BUILD_CONFIGURATIONS) {
        fs::path candidate(replace_all(templated, INTDIR_PLACEHOLDER, config));
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.lexically_normal();
        }
    }
    BASIS_LOG_DEBUG("locate", "no build configuration of " << templated << " exists");
    return fs::path(replace_all(templated, INTDIR_PLACEHOLDER, "")).lexically_normal();
}

std::optional<fs::path> exe_path(std::optional<std::string_view> name, std::string_view prefix,
                                 const target::TargetRegistry* targets) {
    if (!name)
        return current_executable_path();
    if (targets != nullptr && target::is_target(*name, prefix, targets))
        return locate_target(*name, prefix, *targets);
    return locate_command(*name);
}

std::optional<std::string> exe_name(std::optional<std::string_view> name, std::string_view prefix,
                                    const target::TargetRegistry* targets) {
    auto path = exe_path(name, prefix, targets);
    if (!path)
        return std::nullopt;

    std::string file_name = path->filename().string();
#ifdef _WIN32
    if (file_name.size() > 4) {
        std::string suffix = file_name.substr(file_name.size() - 4);
        for (auto& c : suffix)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (suffix == ".exe" || suffix == ".com")
            file_name.resize(file_name.size() - 4);
    }
#endif
    return file_name;
}

std::optional<fs::path> exe_dir(std::optional<std::string_view> name, std::string_view prefix,
                                const target::TargetRegistry* targets) {
    auto path = exe_path(name, prefix, targets);
    if (!path)
        return std::nullopt;
    return path->parent_path();
}

} // namespace basis::exec
