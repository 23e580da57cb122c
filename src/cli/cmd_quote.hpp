//! # Quoting Commands Interface
//!
//! `basis quote <args...>` prints the arguments as one quoted command line.
//! `basis split "<command line>"` prints one argument per line.

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace basis::cli {

int run_quote(const std::vector<std::string>& args, std::ostream& out);

int run_split(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace basis::cli
