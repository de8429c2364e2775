/*
  parser.cpp

  This file is part of vsh, a virtual shell

  MIT License

  Copyright (c) 2026 the vsh authors

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/


#include "parser/parser.h"

#include "parser/delimiter_state.h"
#include "parser/parser_utils.h"
#include "utils/debug.h"

using vsh_filesystem::ErrorKind;
using vsh_filesystem::Result;

const char* redirect_operator(Redirect::Kind kind) {
    switch (kind) {
        case Redirect::Kind::Input:
            return "<";
        case Redirect::Kind::Append:
            return ">>";
        case Redirect::Kind::Error:
            return "2>";
        case Redirect::Kind::ErrorAppend:
            return "2>>";
        case Redirect::Kind::Output:
        default:
            return ">";
    }
}

std::vector<std::string> Parser::parse_semicolon_commands(const std::string& line) {
    std::vector<std::string> statements;
    std::string current;
    DelimiterState delimiters;

    for (size_t i = 0; i < line.size();) {
        if (delimiters.at_top_level() && line[i] == ';') {
            std::string trimmed = trim_whitespace(current);
            if (!trimmed.empty()) {
                statements.push_back(trimmed);
            }
            current.clear();
            ++i;
            continue;
        }
        size_t used = delimiters.feed(line, i);
        current.append(line, i, used);
        i += used;
    }

    std::string trimmed = trim_whitespace(current);
    if (!trimmed.empty()) {
        statements.push_back(trimmed);
    }
    if (delimiters.unterminated()) {
        debug_msg("parser: unterminated quote or substitution in '%s'", line.c_str());
    }
    return statements;
}

std::vector<LogicalCommand> Parser::parse_logical_commands(const std::string& statement) {
    std::vector<LogicalCommand> logical_commands;
    std::string current;
    DelimiterState delimiters;

    auto push_part = [&](const std::string& op) {
        std::string trimmed = trim_whitespace(current);
        current.clear();
        if (!trimmed.empty()) {
            logical_commands.push_back({trimmed, op});
        } else if (!logical_commands.empty()) {
            // "a && && b" or a trailing operator: the empty part vanishes with its operator
            logical_commands.back().op = op;
        }
    };

    for (size_t i = 0; i < statement.size();) {
        if (delimiters.at_top_level() && i + 1 < statement.size()) {
            const char c = statement[i];
            if ((c == '&' || c == '|') && statement[i + 1] == c) {
                push_part(std::string(2, c));
                i += 2;
                continue;
            }
        }
        size_t used = delimiters.feed(statement, i);
        current.append(statement, i, used);
        i += used;
    }
    push_part("");
    return logical_commands;
}

std::vector<std::string> Parser::parse_pipeline(const std::string& part) {
    std::vector<std::string> segments;
    std::string current;
    DelimiterState delimiters;

    for (size_t i = 0; i < part.size();) {
        if (delimiters.at_top_level() && part[i] == '|') {
            bool doubled = (i + 1 < part.size() && part[i + 1] == '|') ||
                           (i > 0 && part[i - 1] == '|');
            if (!doubled) {
                std::string trimmed = trim_whitespace(current);
                if (!trimmed.empty()) {
                    segments.push_back(trimmed);
                }
                current.clear();
                ++i;
                continue;
            }
        }
        size_t used = delimiters.feed(part, i);
        current.append(part, i, used);
        i += used;
    }

    std::string trimmed = trim_whitespace(current);
    if (!trimmed.empty()) {
        segments.push_back(trimmed);
    }
    return segments;
}

Result<Command> Parser::parse_redirects(const std::string& segment) {
    Command command;
    DelimiterState delimiters;
    const size_t length = segment.size();

    for (size_t i = 0; i < length;) {
        const char c = segment[i];
        if (!delimiters.at_top_level() || (c != '>' && c != '<' && c != '2')) {
            size_t used = delimiters.feed(segment, i);
            command.text.append(segment, i, used);
            i += used;
            continue;
        }

        Redirect redirect;
        size_t op_length = 0;
        if (c == '2') {
            // only a word that starts with "2>" names stderr
            bool word_start = i == 0 || is_word_separator(segment[i - 1]);
            if (!word_start || i + 1 >= length || segment[i + 1] != '>') {
                command.text += c;
                ++i;
                continue;
            }
            bool append = i + 2 < length && segment[i + 2] == '>';
            redirect.kind = append ? Redirect::Kind::ErrorAppend : Redirect::Kind::Error;
            op_length = append ? 3 : 2;
        } else if (c == '>') {
            bool append = i + 1 < length && segment[i + 1] == '>';
            redirect.kind = append ? Redirect::Kind::Append : Redirect::Kind::Output;
            op_length = append ? 2 : 1;
        } else {
            redirect.kind = Redirect::Kind::Input;
            op_length = 1;
        }

        size_t j = i + op_length;
        while (j < length && (segment[j] == ' ' || segment[j] == '\t')) {
            ++j;
        }

        // the target runs to the next unquoted space or redirect operator
        std::string raw_target;
        DelimiterState target_state;
        while (j < length) {
            if (target_state.at_top_level() &&
                (is_word_separator(segment[j]) || segment[j] == '>' || segment[j] == '<')) {
                break;
            }
            size_t used = target_state.feed(segment, j);
            raw_target.append(segment, j, used);
            j += used;
        }

        auto words = Tokenizer::tokenize_command(raw_target);
        if (words.empty() || words.front().empty()) {
            return Result<Command>::error(ErrorKind::InvalidArgument,
                                          "syntax error near unexpected token 'newline'");
        }
        redirect.target = words.front();
        command.redirects.push_back(std::move(redirect));

        command.text += ' ';
        i = j;
    }

    command.text = trim_whitespace(command.text);
    return Result<Command>::ok(std::move(command));
}
