//! # Target Registry and Resolver
//!
//! Maps symbolic build-target names to target UIDs and from there to the
//! build-output path recorded for the target.
//!
//! ## Target Names
//!
//! A target UID is the target name prepended by a `.`-separated project
//! namespace, e.g. `myproj.tool`. On the wire a leading separator marks a
//! name that is already fully qualified ("rooted"):
//!
//! | Wire form      | Parsed as                    |
//! |----------------|------------------------------|
//! | `tool`         | `UnqualifiedName{"tool"}`    |
//! | `.myproj.tool` | `QualifiedName{"myproj.tool"}` |
//!
//! Unqualified names are resolved against the registry by trying the caller's
//! namespace prefix, then the first segment of that prefix. A prefix is only
//! ever shortened, never widened: `a.b.c` tries `a.b.c.tool`, then `a.tool`.
//!
//! ## Ownership
//!
//! The registry is populated by the caller (or loaded from a target manifest)
//! and only read during resolution.

#ifndef BASIS_TARGET_TARGET_REGISTRY_HPP
#define BASIS_TARGET_TARGET_REGISTRY_HPP

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace basis::target {

namespace fs = std::filesystem;

/// Separates namespace segments of a target UID.
constexpr char NAMESPACE_SEPARATOR = '.';

/// A rooted target name. `uid` is stored without the leading separator.
struct QualifiedName {
    std::string uid;
};

/// A target name that still needs the caller's namespace prefix.
struct UnqualifiedName {
    std::string name;
};

using TargetName = std::variant<QualifiedName, UnqualifiedName>;

/// Parses a wire-format target name. Returns std::nullopt for an empty name.
std::optional<TargetName> parse_target_name(std::string_view wire);

/// Renders a target name in wire format (rooted names get a leading separator).
std::string to_string(const TargetName& name);

/// Read-only mapping of target UIDs to build-output paths.
///
/// Paths may be relative to `base_dir()` and may contain the `$(IntDir)`
/// build-configuration placeholder. An empty base directory stands for the
/// directory of the running program.
class TargetRegistry {
public:
    using Map = std::map<std::string, std::string, std::less<>>;

    TargetRegistry() = default;
    explicit TargetRegistry(fs::path base_dir) : base_dir_(std::move(base_dir)) {}

    /// Adds a target. Returns false if `uid` is empty or already registered.
    bool add(std::string uid, std::string path);

    bool contains(std::string_view uid) const {
        return entries_.find(uid) != entries_.end();
    }

    /// Returns the stored path of `uid`, or nullptr if unknown.
    const std::string* find(std::string_view uid) const;

    bool empty() const {
        return entries_.empty();
    }
    size_t size() const {
        return entries_.size();
    }

    const fs::path& base_dir() const {
        return base_dir_;
    }
    void set_base_dir(fs::path base_dir) {
        base_dir_ = std::move(base_dir);
    }

    Map::const_iterator begin() const {
        return entries_.begin();
    }
    Map::const_iterator end() const {
        return entries_.end();
    }

private:
    Map entries_;
    fs::path base_dir_;
};

/// Returns the UID of the named build target.
///
/// - Empty `name`: std::nullopt.
/// - Rooted `name`: returned unchanged, including its leading separator.
/// - Empty `prefix`, or null/empty `targets`: `name` unchanged.
/// - Otherwise the first of `prefix.name`, `<first prefix segment>.name`
///   that is registered, or `name` unchanged if neither is.
std::optional<std::string> target_uid(std::string_view name, std::string_view prefix = {},
                                      const TargetRegistry* targets = nullptr);

/// Whether `name` resolves to a registered target.
bool is_target(std::string_view name, std::string_view prefix = {},
               const TargetRegistry* targets = nullptr);

/// Returns the registered (possibly relative, possibly templated) build-output
/// path of the named target, or std::nullopt if it is not a known target.
std::optional<std::string> target_path(std::string_view name, std::string_view prefix = {},
                                       const TargetRegistry* targets = nullptr);

} // namespace basis::target

#endif // BASIS_TARGET_TARGET_REGISTRY_HPP
