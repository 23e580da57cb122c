//! # Target Manifest Parser
//!
//! Parses the `[project]` and `[targets]` sections of a target manifest into
//! a `TargetManifest`. Errors carry the origin and line number, e.g.
//! `targets.toml:7: unterminated string`.

#include "target/target_manifest.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace basis::target {

namespace {

bool is_bare_key_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-' || c == '.';
}

} // namespace

Result<TargetManifest, std::string> TargetManifest::load(const fs::path& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        return "cannot open target manifest: " + path.string();
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        return "cannot resolve target manifest path " + path.string() + ": " + ec.message();
    }
    fs::path manifest_dir = absolute.parent_path();
    BASIS_LOG_DEBUG("manifest", "Loading " << path.string());
    return parse(buffer.str(), manifest_dir, path.filename().string());
}

Result<TargetManifest, std::string> TargetManifest::parse(const std::string& content,
                                                          const fs::path& manifest_dir,
                                                          const std::string& origin) {
    ManifestParser parser(content, manifest_dir, origin);
    return parser.parse();
}

ManifestParser::ManifestParser(const std::string& content, fs::path manifest_dir,
                               std::string origin)
    : content_(content), manifest_dir_(std::move(manifest_dir)), origin_(std::move(origin)) {}

char ManifestParser::advance() {
    char c = content_[pos_++];
    if (c == '\n')
        ++line_;
    return c;
}

void ManifestParser::skip_blanks() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t'))
        advance();
}

void ManifestParser::skip_comment() {
    while (!is_eof() && peek() != '\n')
        advance();
}

bool ManifestParser::at_line_end() {
    skip_blanks();
    if (peek() == '#')
        skip_comment();
    if (peek() == '\r')
        advance();
    return is_eof() || peek() == '\n';
}

std::string ManifestParser::located(const std::string& message) const {
    return origin_ + ":" + std::to_string(line_) + ": " + message;
}

std::optional<std::string> ManifestParser::parse_section_header(std::string& error) {
    advance(); // '['
    if (peek() == '[') {
        error = "array sections are not supported";
        return std::nullopt;
    }
    skip_blanks();
    std::string name;
    while (!is_eof() && is_bare_key_char(peek()))
        name += advance();
    skip_blanks();
    if (peek() != ']' || name.empty()) {
        error = "malformed section header";
        return std::nullopt;
    }
    advance(); // ']'
    return name;
}

std::optional<std::string> ManifestParser::parse_key(std::string& error) {
    if (peek() == '"')
        return parse_string(error);

    std::string key;
    while (!is_eof() && is_bare_key_char(peek()))
        key += advance();
    if (key.empty()) {
        error = std::string("unexpected character '") + peek() + "'";
        return std::nullopt;
    }
    return key;
}

std::optional<std::string> ManifestParser::parse_string(std::string& error) {
    if (peek() != '"') {
        error = "expected a double-quoted string";
        return std::nullopt;
    }
    advance();

    std::string value;
    while (true) {
        if (is_eof() || peek() == '\n') {
            error = "unterminated string";
            return std::nullopt;
        }
        char c = advance();
        if (c == '"')
            return value;
        if (c != '\\') {
            value += c;
            continue;
        }
        if (is_eof()) {
            error = "unterminated string";
            return std::nullopt;
        }
        char escaped = advance();
        switch (escaped) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case 'n':
            value += '\n';
            break;
        case 't':
            value += '\t';
            break;
        default:
            error = std::string("invalid escape sequence '\\") + escaped + "'";
            return std::nullopt;
        }
    }
}

bool ManifestParser::apply(TargetManifest& manifest, const std::string& key, std::string value,
                           std::string& error) {
    if (section_.empty()) {
        error = "key '" + key + "' outside of a section";
        return false;
    }

    if (section_ == "project") {
        ProjectInfo& info = manifest.project;
        if (key == "name") {
            info.name = std::move(value);
        } else if (key == "version") {
            info.version = std::move(value);
        } else if (key == "prefix") {
            info.prefix = std::move(value);
        } else if (key == "contact") {
            info.contact = std::move(value);
        } else if (key == "copyright") {
            info.copyright = std::move(value);
        } else if (key == "license") {
            info.license = std::move(value);
        } else {
            BASIS_LOG_WARN("manifest", located("unknown project key '" + key + "'"));
        }
        return true;
    }

    if (section_ == "targets") {
        if (key == "base_dir") {
            fs::path base(value);
            if (base.is_relative())
                base = manifest_dir_ / base;
            manifest.targets.set_base_dir(base.lexically_normal());
            return true;
        }
        if (!manifest.targets.add(key, std::move(value))) {
            error = "duplicate target '" + key + "'";
            return false;
        }
        return true;
    }

    // Keys of unknown sections were already reported with the section header.
    return true;
}

Result<TargetManifest, std::string> ManifestParser::parse() {
    TargetManifest manifest;
    manifest.targets.set_base_dir(manifest_dir_);

    std::string error;
    while (!is_eof()) {
        skip_blanks();
        char c = peek();

        if (c == '\n' || c == '\r') {
            advance();
            continue;
        }
        if (c == '#') {
            skip_comment();
            continue;
        }
        if (is_eof())
            break;

        if (c == '[') {
            auto name = parse_section_header(error);
            if (!name)
                return located(error);
            section_ = *name;
            if (section_ != "project" && section_ != "targets") {
                BASIS_LOG_WARN("manifest", located("ignoring unknown section [" + section_ + "]"));
            }
            if (!at_line_end())
                return located("unexpected text after section header");
            continue;
        }

        auto key = parse_key(error);
        if (!key)
            return located(error);

        skip_blanks();
        if (peek() != '=')
            return located("expected '=' after key '" + *key + "'");
        advance();
        skip_blanks();

        auto value = parse_string(error);
        if (!value)
            return located(error);
        if (!at_line_end())
            return located("unexpected text after value of '" + *key + "'");

        if (!apply(manifest, *key, std::move(*value), error))
            return located(error);
    }

    BASIS_LOG_DEBUG("manifest", origin_ << ": " << manifest.targets.size() << " target(s), base "
                                        << manifest.targets.base_dir().string());
    return manifest;
}

} // namespace basis::target
