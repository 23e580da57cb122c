//! # Banner Tests

#include "exec/banner.hpp"

#include <gtest/gtest.h>
#include <sstream>

using namespace basis;
using namespace basis::exec;

TEST(BannerTest, ContactBlock) {
    std::ostringstream out;
    print_contact(out, "Team <team@example.org>");

    EXPECT_EQ(out.str(), "Contact:\n  Team <team@example.org>\n");
}

TEST(BannerTest, VersionWithProjectCopyrightAndLicense) {
    ProgramInfo info;
    info.name = "tool";
    info.version = "1.2.0";
    info.project = "MyProject";
    info.copyright = "2024 Example Org";
    info.license = "See COPYING file.";

    std::ostringstream out;
    ASSERT_TRUE(print_version(out, info));
    EXPECT_EQ(out.str(), "tool (MyProject) 1.2.0\n"
                         "Copyright (c) 2024 Example Org. All rights reserved.\n"
                         "See COPYING file.\n");
}

TEST(BannerTest, EmptyFieldsAreOmitted) {
    ProgramInfo info;
    info.name = "tool";
    info.version = "0.1";
    info.copyright.clear();
    info.license.clear();

    std::ostringstream out;
    ASSERT_TRUE(print_version(out, info));
    EXPECT_EQ(out.str(), "tool 0.1\n");
}

TEST(BannerTest, MissingVersionPrintsNothing) {
    ProgramInfo info;
    info.name = "tool";

    std::ostringstream out;
    EXPECT_FALSE(print_version(out, info));
    EXPECT_TRUE(out.str().empty());
}

TEST(BannerTest, DefaultsComeFromBuildConfiguration) {
    ProgramInfo info;
    EXPECT_EQ(info.contact, DEFAULT_CONTACT);
    EXPECT_EQ(info.copyright, DEFAULT_COPYRIGHT);
    EXPECT_EQ(info.license, DEFAULT_LICENSE);
}
