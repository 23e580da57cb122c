//! # Command Line Quoting Implementation

#include "exec/quoting.hpp"

#include <cctype>

namespace basis::exec {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool needs_quotes(std::string_view arg) {
    if (arg.empty())
        return true;
    for (char c : arg) {
        if (c == '\'' || is_space(c))
            return true;
    }
    return false;
}

} // namespace

std::string to_quoted_string(const std::vector<std::string>& args) {
    std::string result;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0)
            result += ' ';

        std::string escaped;
        escaped.reserve(args[i].size());
        for (char c : args[i]) {
            if (c == '"')
                escaped += '\\';
            escaped += c;
        }

        if (needs_quotes(escaped)) {
            result += '"';
            result += escaped;
            result += '"';
        } else {
            result += escaped;
        }
    }
    return result;
}

Result<std::vector<std::string>, SplitError> qsplit(std::string_view command_line) {
    enum class State { Between, Word, Single, Double };

    std::vector<std::string> args;
    std::string current;
    State state = State::Between;

    for (size_t i = 0; i < command_line.size(); ++i) {
        char c = command_line[i];

        switch (state) {
        case State::Between:
        case State::Word:
            if (is_space(c)) {
                if (state == State::Word) {
                    args.push_back(std::move(current));
                    current.clear();
                    state = State::Between;
                }
            } else if (c == '\'') {
                state = State::Single;
            } else if (c == '"') {
                state = State::Double;
            } else if (c == '\\') {
                if (i + 1 >= command_line.size())
                    return SplitError{"No escaped character"};
                current += command_line[++i];
                state = State::Word;
            } else {
                current += c;
                state = State::Word;
            }
            break;

        case State::Single:
            if (c == '\'') {
                state = State::Word;
            } else {
                current += c;
            }
            break;

        case State::Double:
            if (c == '"') {
                state = State::Word;
            } else if (c == '\\' && i + 1 < command_line.size() &&
                       (command_line[i + 1] == '"' || command_line[i + 1] == '\\')) {
                current += command_line[++i];
            } else {
                current += c;
            }
            break;
        }
    }

    if (state == State::Single || state == State::Double)
        return SplitError{"No closing quotation"};
    if (state == State::Word)
        args.push_back(std::move(current));
    return args;
}

} // namespace basis::exec
