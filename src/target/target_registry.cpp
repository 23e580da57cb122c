//! # Target Resolver Implementation

#include "target/target_registry.hpp"

#include "log/log.hpp"

namespace basis::target {

namespace {

template <class... Ts> struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

/// Strips the rooted-name marker, if any.
std::string_view strip_root(std::string_view uid) {
    if (!uid.empty() && uid.front() == NAMESPACE_SEPARATOR) {
        uid.remove_prefix(1);
    }
    return uid;
}

std::string join_uid(std::string_view prefix, std::string_view name) {
    std::string uid;
    uid.reserve(prefix.size() + 1 + name.size());
    uid.append(prefix);
    uid.push_back(NAMESPACE_SEPARATOR);
    uid.append(name);
    return uid;
}

/// Tries the full prefix, then its first segment. Never widens.
std::string qualify(const std::string& name, std::string_view prefix,
                    const TargetRegistry& targets) {
    while (true) {
        std::string candidate = join_uid(prefix, name);
        if (targets.contains(candidate)) {
            BASIS_LOG_TRACE("target", "'" << name << "' qualified as '" << candidate << "'");
            return candidate;
        }
        size_t sep = prefix.find(NAMESPACE_SEPARATOR);
        if (sep == std::string_view::npos)
            break;
        prefix = prefix.substr(0, sep);
    }
    BASIS_LOG_TRACE("target", "'" << name << "' is not a target of namespace '" << prefix << "'");
    return name;
}

} // namespace

std::optional<TargetName> parse_target_name(std::string_view wire) {
    if (wire.empty())
        return std::nullopt;
    if (wire.front() == NAMESPACE_SEPARATOR)
        return QualifiedName{std::string(wire.substr(1))};
    return UnqualifiedName{std::string(wire)};
}

std::string to_string(const TargetName& name) {
    return std::visit(Overloaded{
                          [](const QualifiedName& q) { return NAMESPACE_SEPARATOR + q.uid; },
                          [](const UnqualifiedName& u) { return u.name; },
                      },
                      name);
}

bool TargetRegistry::add(std::string uid, std::string path) {
    if (uid.empty())
        return false;
    return entries_.emplace(std::move(uid), std::move(path)).second;
}

const std::string* TargetRegistry::find(std::string_view uid) const {
    auto it = entries_.find(uid);
    return it == entries_.end() ? nullptr : &it->second;
}

std::optional<std::string> target_uid(std::string_view name, std::string_view prefix,
                                      const TargetRegistry* targets) {
    auto parsed = parse_target_name(name);
    if (!parsed)
        return std::nullopt;

    return std::visit(Overloaded{
                          [](const QualifiedName& q) { return to_string(TargetName{q}); },
                          [&](const UnqualifiedName& u) {
                              if (prefix.empty() || targets == nullptr || targets->empty())
                                  return u.name;
                              return qualify(u.name, prefix, *targets);
                          },
                      },
                      *parsed);
}

bool is_target(std::string_view name, std::string_view prefix, const TargetRegistry* targets) {
    auto uid = target_uid(name, prefix, targets);
    if (!uid || targets == nullptr || targets->empty())
        return false;
    return targets->contains(strip_root(*uid));
}

std::optional<std::string> target_path(std::string_view name, std::string_view prefix,
                                       const TargetRegistry* targets) {
    if (!is_target(name, prefix, targets))
        return std::nullopt;
    auto uid = target_uid(name, prefix, targets);
    const std::string* path = targets->find(strip_root(*uid));
    if (path == nullptr)
        return std::nullopt;
    return *path;
}

} // namespace basis::target
