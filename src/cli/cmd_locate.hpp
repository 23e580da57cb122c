//! # Locate Commands Interface
//!
//! | Command                  | Prints                                     |
//! |--------------------------|--------------------------------------------|
//! | `basis path [<name>]`    | Absolute path of the executable            |
//! | `basis name [<name>]`    | File name of the executable                |
//! | `basis dir [<name>]`     | Directory containing the executable        |
//! | `basis uid <name>`       | Fully qualified identifier of a target     |
//!
//! Without `<name>`, `path`, `name` and `dir` describe `basis` itself.

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace basis::cli {

enum class LocateQuery { Path, Name, Dir };

int run_locate(LocateQuery query, const std::vector<std::string>& args, std::ostream& out,
               std::ostream& err);

int run_uid(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace basis::cli
