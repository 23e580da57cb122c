//! # Target Manifest Tests
//!
//! Tests for parsing `[project]` / `[targets]` manifests, base directory
//! handling and error reporting.

#include "target/target_manifest.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace basis;
using namespace basis::target;
namespace fs = std::filesystem;

namespace {

TargetManifest parse_ok(const std::string& content, const fs::path& dir = "/work/proj") {
    auto result = TargetManifest::parse(content, dir, "targets.toml");
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result) : "");
    if (is_err(result))
        return TargetManifest{};
    return std::move(unwrap(result));
}

std::string parse_error(const std::string& content) {
    auto result = TargetManifest::parse(content, "/work/proj", "targets.toml");
    EXPECT_TRUE(is_err(result));
    return is_err(result) ? unwrap_err(result) : std::string();
}

} // namespace

// ============================================================================
// Sections and Values
// ============================================================================

TEST(TargetManifestTest, ParsesProjectAndTargets) {
    auto manifest = parse_ok(R"(
# Build targets of MyProject
[project]
name = "MyProject"
version = "1.2.0"
prefix = "myproj"
contact = "Team <team@example.org>"
copyright = "2024 Example Org"
license = "See COPYING file."

[targets]
"myproj.tool" = "bin/tool"
myproj.helper = "bin/$(IntDir)/helper"   # configuration-specific
)");

    EXPECT_EQ(manifest.project.name, "MyProject");
    EXPECT_EQ(manifest.project.version, "1.2.0");
    EXPECT_EQ(manifest.project.prefix, "myproj");
    EXPECT_EQ(manifest.project.contact, "Team <team@example.org>");
    EXPECT_EQ(manifest.project.copyright, "2024 Example Org");
    EXPECT_EQ(manifest.project.license, "See COPYING file.");

    ASSERT_EQ(manifest.targets.size(), 2u);
    ASSERT_NE(manifest.targets.find("myproj.tool"), nullptr);
    EXPECT_EQ(*manifest.targets.find("myproj.tool"), "bin/tool");
    ASSERT_NE(manifest.targets.find("myproj.helper"), nullptr);
    EXPECT_EQ(*manifest.targets.find("myproj.helper"), "bin/$(IntDir)/helper");
}

TEST(TargetManifestTest, DottedBareKeysAreLiteral) {
    auto manifest = parse_ok("[targets]\na.b.c = \"x\"\n");

    EXPECT_TRUE(manifest.targets.contains("a.b.c"));
    EXPECT_FALSE(manifest.targets.contains("c"));
}

TEST(TargetManifestTest, StringEscapes) {
    auto manifest = parse_ok(R"([project]
name = "say \"hi\""
license = "line1\nline2\tend \\ done"
)");

    EXPECT_EQ(manifest.project.name, "say \"hi\"");
    EXPECT_EQ(manifest.project.license, "line1\nline2\tend \\ done");
}

TEST(TargetManifestTest, CrLfLineEndings) {
    auto manifest = parse_ok("[targets]\r\ntool = \"bin/tool\"\r\n");

    EXPECT_TRUE(manifest.targets.contains("tool"));
}

TEST(TargetManifestTest, UnknownSectionsAndKeysAreIgnored) {
    auto manifest = parse_ok(R"([project]
name = "p"
homepage = "https://example.org"

[build]
jobs = "4"

[targets]
tool = "bin/tool"
)");

    EXPECT_EQ(manifest.project.name, "p");
    EXPECT_EQ(manifest.targets.size(), 1u);
}

TEST(TargetManifestTest, MissingProjectKeysKeepDefaults) {
    auto manifest = parse_ok("[project]\nname = \"p\"\n");

    EXPECT_EQ(manifest.project.contact, DEFAULT_CONTACT);
    EXPECT_EQ(manifest.project.copyright, DEFAULT_COPYRIGHT);
    EXPECT_EQ(manifest.project.license, DEFAULT_LICENSE);
    EXPECT_TRUE(manifest.project.prefix.empty());
}

// ============================================================================
// Base Directory
// ============================================================================

TEST(TargetManifestTest, BaseDirDefaultsToManifestDir) {
    auto manifest = parse_ok("[targets]\ntool = \"bin/tool\"\n", "/work/proj");

    EXPECT_EQ(manifest.targets.base_dir(), fs::path("/work/proj"));
}

TEST(TargetManifestTest, RelativeBaseDirResolvesAgainstManifestDir) {
    auto manifest = parse_ok("[targets]\nbase_dir = \"../lib\"\n", "/work/proj/etc");

    EXPECT_EQ(manifest.targets.base_dir(), fs::path("/work/proj/lib"));
    EXPECT_TRUE(manifest.targets.empty());
}

#ifndef _WIN32
TEST(TargetManifestTest, AbsoluteBaseDirIsKept) {
    auto manifest = parse_ok("[targets]\nbase_dir = \"/opt/tools\"\n");

    EXPECT_EQ(manifest.targets.base_dir(), fs::path("/opt/tools"));
}
#endif

// ============================================================================
// Errors
// ============================================================================

TEST(TargetManifestErrorTest, UnterminatedString) {
    EXPECT_EQ(parse_error("[targets]\ntool = \"bin/tool\n"), "targets.toml:2: unterminated string");
}

TEST(TargetManifestErrorTest, MissingEquals) {
    EXPECT_EQ(parse_error("[targets]\n\ntool \"bin/tool\"\n"),
              "targets.toml:3: expected '=' after key 'tool'");
}

TEST(TargetManifestErrorTest, DuplicateTarget) {
    EXPECT_EQ(parse_error("[targets]\ntool = \"a\"\n\"tool\" = \"b\"\n"),
              "targets.toml:3: duplicate target 'tool'");
}

TEST(TargetManifestErrorTest, MalformedSectionHeader) {
    EXPECT_EQ(parse_error("[targets\ntool = \"a\"\n"), "targets.toml:1: malformed section header");
    EXPECT_EQ(parse_error("[[targets]]\n"), "targets.toml:1: array sections are not supported");
}

TEST(TargetManifestErrorTest, KeyOutsideSection) {
    EXPECT_EQ(parse_error("tool = \"a\"\n"), "targets.toml:1: key 'tool' outside of a section");
}

TEST(TargetManifestErrorTest, ValueMustBeString) {
    EXPECT_EQ(parse_error("[project]\nversion = 3\n"),
              "targets.toml:2: expected a double-quoted string");
}

TEST(TargetManifestErrorTest, TrailingText) {
    EXPECT_EQ(parse_error("[targets]\ntool = \"a\" \"b\"\n"),
              "targets.toml:2: unexpected text after value of 'tool'");
}

TEST(TargetManifestErrorTest, InvalidEscape) {
    EXPECT_EQ(parse_error("[project]\nname = \"a\\qb\"\n"),
              "targets.toml:2: invalid escape sequence '\\q'");
}

// ============================================================================
// Loading from Disk
// ============================================================================

class TargetManifestFileTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / "basis_target_manifest_test";
        fs::remove_all(dir);
        fs::create_directories(dir / "etc");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

TEST_F(TargetManifestFileTest, LoadUsesFileDirectoryAndName) {
    fs::path file = dir / "etc" / "targets.toml";
    {
        std::ofstream out(file);
        out << "[targets]\nbase_dir = \"../bin\"\ntool = \"tool\"\n";
    }

    auto result = TargetManifest::load(file);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    const auto& manifest = unwrap(result);
    EXPECT_EQ(manifest.targets.base_dir(), (dir / "bin").lexically_normal());
    EXPECT_TRUE(manifest.targets.contains("tool"));
}

TEST_F(TargetManifestFileTest, ErrorsNameTheFile) {
    fs::path file = dir / "broken.toml";
    {
        std::ofstream out(file);
        out << "[targets]\ntool = \"a\n";
    }

    auto result = TargetManifest::load(file);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), "broken.toml:2: unterminated string");
}

TEST_F(TargetManifestFileTest, MissingFile) {
    auto result = TargetManifest::load(dir / "missing.toml");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("cannot open target manifest"), std::string::npos);
}

TEST_F(TargetManifestFileTest, RelativePathResolvesAgainstWorkingDirectory) {
    {
        std::ofstream out(dir / "etc" / "targets.toml");
        out << "[targets]\nbase_dir = \"../bin\"\ntool = \"tool\"\n";
    }

    fs::path previous = fs::current_path();
    fs::current_path(dir);
    auto result = TargetManifest::load(fs::path("etc") / "targets.toml");
    fs::current_path(previous);

    ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
    const auto& base_dir = unwrap(result).targets.base_dir();
    EXPECT_TRUE(base_dir.is_absolute()) << base_dir;
    EXPECT_TRUE(fs::equivalent(base_dir.parent_path(), dir)) << base_dir;
    EXPECT_EQ(base_dir.filename(), "bin");
}
