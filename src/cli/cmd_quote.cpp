#include "cmd_quote.hpp"

#include "exec/quoting.hpp"
#include "utils.hpp"

namespace basis::cli {

int run_quote(const std::vector<std::string>& args, std::ostream& out) {
    out << exec::to_quoted_string(args) << '\n';
    return 0;
}

int run_split(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    if (args.size() != 1) {
        err << "Usage: basis split \"<command line>\"\n";
        return 1;
    }

    auto split = exec::qsplit(args[0]);
    if (is_err(split))
        return report_error(err, unwrap_err(split).message);

    for (const auto& arg : unwrap(split)) {
        out << arg << '\n';
    }
    return 0;
}

} // namespace basis::cli
