//! # Target Manifest
//!
//! Loads a project's executable targets and banner information from a small
//! TOML-subset file.
//!
//! ## Manifest Sections
//!
//! | Section     | Keys                                                   |
//! |-------------|--------------------------------------------------------|
//! | `[project]` | name, version, prefix, contact, copyright, license     |
//! | `[targets]` | base_dir, plus one `uid = "path"` entry per target     |
//!
//! ```toml
//! [project]
//! name = "MyProject"
//! prefix = "myproj"
//!
//! [targets]
//! base_dir = "../lib"
//! "myproj.tool" = "bin/tool"
//! myproj.helper = "bin/$(IntDir)/helper"
//! ```
//!
//! Bare keys may contain dots and are taken literally. Relative `base_dir`
//! values resolve against the manifest's directory, which is also the default.

#ifndef BASIS_TARGET_TARGET_MANIFEST_HPP
#define BASIS_TARGET_TARGET_MANIFEST_HPP

#include "common.hpp"
#include "target/target_registry.hpp"

#include <filesystem>
#include <string>

namespace basis::target {

/// Project information from the [project] section.
struct ProjectInfo {
    std::string name;
    std::string version;
    std::string prefix;
    std::string contact = DEFAULT_CONTACT;
    std::string copyright = DEFAULT_COPYRIGHT;
    std::string license = DEFAULT_LICENSE;
};

/// A parsed target manifest.
struct TargetManifest {
    ProjectInfo project;
    TargetRegistry targets;

    /// Load and parse a manifest file.
    static Result<TargetManifest, std::string> load(const fs::path& path);

    /// Parse manifest content. Relative base directories resolve against
    /// `manifest_dir`; `origin` names the content in error messages.
    static Result<TargetManifest, std::string> parse(const std::string& content,
                                                     const fs::path& manifest_dir,
                                                     const std::string& origin = "<manifest>");
};

/// Line-oriented parser for the manifest's TOML subset.
///
/// Handles:
/// - Sections: [section]
/// - Key-value pairs: key = "value" with bare or quoted keys
/// - Comments: # to end of line
class ManifestParser {
public:
    ManifestParser(const std::string& content, fs::path manifest_dir, std::string origin);

    Result<TargetManifest, std::string> parse();

private:
    std::string content_;
    fs::path manifest_dir_;
    std::string origin_;
    size_t pos_ = 0;
    int line_ = 1;
    std::string section_;

    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    void skip_blanks();
    void skip_comment();
    bool at_line_end();

    std::optional<std::string> parse_section_header(std::string& error);
    std::optional<std::string> parse_key(std::string& error);
    std::optional<std::string> parse_string(std::string& error);

    bool apply(TargetManifest& manifest, const std::string& key, std::string value,
               std::string& error);

    std::string located(const std::string& message) const;
};

} // namespace basis::target

#endif // BASIS_TARGET_TARGET_MANIFEST_HPP
