#include "interpreter/command_substitution_evaluator.h"

#include <utility>

#include "utils/debug.h"

CommandSubstitutionEvaluator::CommandSubstitutionEvaluator(CommandExecutor executor)
    : command_executor_(std::move(executor)) {
}

std::optional<size_t> CommandSubstitutionEvaluator::find_matching_paren(const std::string& text,
                                                                        size_t open_index) {
    int depth = 1;
    bool in_single = false;
    bool in_double = false;

    for (size_t j = open_index + 1; j < text.size(); ++j) {
        const char c = text[j];
        if (in_single) {
            if (c == '\'') {
                in_single = false;
            }
            continue;
        }
        if (c == '\\') {
            ++j;
            continue;
        }
        if (c == '"') {
            in_double = !in_double;
            continue;
        }
        if (in_double) {
            continue;
        }
        if (c == '\'') {
            in_single = true;
        } else if (c == '(') {
            ++depth;
        } else if (c == ')') {
            if (--depth == 0) {
                return j;
            }
        }
    }
    return std::nullopt;
}

std::optional<size_t> CommandSubstitutionEvaluator::find_closing_backtick(const std::string& text,
                                                                          size_t open_index) {
    for (size_t j = open_index + 1; j < text.size(); ++j) {
        if (text[j] == '\\') {
            ++j;
            continue;
        }
        if (text[j] == '`') {
            return j;
        }
    }
    return std::nullopt;
}

std::string CommandSubstitutionEvaluator::capture_command_output(const std::string& command,
                                                                 ExpansionResult& result) {
    ExecResult exec_result = command_executor_(command);
    result.stderr_text += exec_result.stderr_text;

    std::string output = std::move(exec_result.stdout_text);
    if (!output.empty() && output.back() == '\n') {
        output.pop_back();
    }
    return output;
}

// The output is spliced back into text that is still going to be split into
// redirects and words, so characters with syntactic meaning are escaped.
void CommandSubstitutionEvaluator::append_substitution_result(const std::string& content,
                                                              bool in_double_quotes,
                                                              std::string& output) {
    for (char c : content) {
        bool special = c == '\\' || c == '"';
        if (!in_double_quotes) {
            special = special || c == '\'' || c == '>' || c == '<';
        }
        if (special) {
            output += '\\';
        }
        output += c;
    }
}

CommandSubstitutionEvaluator::ExpansionResult CommandSubstitutionEvaluator::expand_substitutions(
    const std::string& input) {
    ExpansionResult result;
    std::string& text = result.text;
    text.reserve(input.size());

    bool in_single = false;
    bool in_double = false;

    for (size_t i = 0; i < input.size(); ++i) {
        const char c = input[i];

        if (in_single) {
            if (c == '\'') {
                in_single = false;
            }
            text += c;
            continue;
        }

        if (c == '\\') {
            text += c;
            if (i + 1 < input.size()) {
                text += input[++i];
            }
            continue;
        }

        if (c == '\'' && !in_double) {
            in_single = true;
            text += c;
            continue;
        }

        if (c == '"') {
            in_double = !in_double;
            text += c;
            continue;
        }

        if (c == '$' && i + 1 < input.size() && input[i + 1] == '(') {
            auto close = find_matching_paren(input, i + 1);
            if (!close) {
                debug_msg("substitution: unterminated $( left literal");
                text.append(input, i, std::string::npos);
                break;
            }
            std::string inner = input.substr(i + 2, *close - i - 2);
            append_substitution_result(capture_command_output(inner, result), in_double, text);
            i = *close;
            continue;
        }

        if (c == '`') {
            auto close = find_closing_backtick(input, i);
            if (!close) {
                text.append(input, i, std::string::npos);
                break;
            }
            std::string inner = input.substr(i + 1, *close - i - 1);
            append_substitution_result(capture_command_output(inner, result), in_double, text);
            i = *close;
            continue;
        }

        text += c;
    }
    return result;
}
