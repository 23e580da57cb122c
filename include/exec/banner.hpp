//! # Program Banners
//!
//! Version and contact information printed by executables in response to
//! `--version` and `--help`. The defaults of `ProgramInfo` come from the
//! build configuration (`BASIS_DEFAULT_CONTACT`, `BASIS_DEFAULT_COPYRIGHT`,
//! `BASIS_DEFAULT_LICENSE`).
//!
//! ```text
//! tool (MyProject) 1.2.0
//! Copyright (c) 2024 Example Org. All rights reserved.
//! See COPYING file.
//!
//! Contact:
//!   Team <team@example.org>
//! ```

#ifndef BASIS_EXEC_BANNER_HPP
#define BASIS_EXEC_BANNER_HPP

#include "common.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace basis::exec {

/// Identity of an executable as shown in its banners.
struct ProgramInfo {
    std::string name;
    std::string version;
    std::string project; ///< Omitted from the version line when empty.
    std::string copyright = DEFAULT_COPYRIGHT;
    std::string license = DEFAULT_LICENSE;
    std::string contact = DEFAULT_CONTACT;
};

/// Prints "Contact:" followed by the indented contact line.
void print_contact(std::ostream& out, std::string_view contact = DEFAULT_CONTACT);

/// Prints the version line, then the copyright and license lines when set.
/// Returns false without printing anything if `info.version` is empty.
[[nodiscard]] bool print_version(std::ostream& out, const ProgramInfo& info);

} // namespace basis::exec

#endif // BASIS_EXEC_BANNER_HPP
