//! # Program Banners Implementation

#include "exec/banner.hpp"

#include "log/log.hpp"

namespace basis::exec {

void print_contact(std::ostream& out, std::string_view contact) {
    out << "Contact:\n  " << contact << '\n';
}

bool print_version(std::ostream& out, const ProgramInfo& info) {
    if (info.version.empty()) {
        BASIS_LOG_ERROR("cli", "print_version called without a version for '" << info.name << "'");
        return false;
    }

    out << info.name;
    if (!info.project.empty()) {
        out << " (" << info.project << ")";
    }
    out << ' ' << info.version << '\n';

    if (!info.copyright.empty()) {
        out << "Copyright (c) " << info.copyright << ". All rights reserved.\n";
    }
    if (!info.license.empty()) {
        out << info.license << '\n';
    }
    return true;
}

} // namespace basis::exec
