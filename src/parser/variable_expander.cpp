#include "parser/variable_expander.h"

#include "parser/delimiter_state.h"
#include "parser/parser_utils.h"
#include "session.h"

VariableExpander::VariableExpander(const Session& session) : session_(session) {
}

std::string VariableExpander::get_variable_value(const std::string& var_name) const {
    if (var_name == "?") {
        return std::to_string(session_.last_exit_code);
    }
    return session_.get_env(var_name);
}

std::string VariableExpander::expand(const std::string& line) const {
    std::string result;
    result.reserve(line.size());
    DelimiterState delimiters;
    const size_t length = line.size();

    for (size_t i = 0; i < length;) {
        const bool expandable = line[i] == '$' && i + 1 < length &&
                                delimiters.state != LexState::InSingleQuote &&
                                delimiters.state != LexState::Escaped;
        if (expandable) {
            const char next = line[i + 1];
            if (next == '?') {
                result += get_variable_value("?");
                i += 2;
                continue;
            }
            if (next == '{') {
                size_t close = line.find('}', i + 2);
                if (close != std::string::npos) {
                    std::string name = line.substr(i + 2, close - i - 2);
                    if (is_valid_identifier(name)) {
                        result += get_variable_value(name);
                        i = close + 1;
                        continue;
                    }
                }
            } else if (is_identifier_start(next)) {
                size_t end = i + 1;
                while (end < length && is_identifier_char(line[end])) {
                    ++end;
                }
                result += get_variable_value(line.substr(i + 1, end - i - 1));
                i = end;
                continue;
            }
        }

        size_t used = delimiters.feed(line, i);
        result.append(line, i, used);
        i += used;
    }
    return result;
}
