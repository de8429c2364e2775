/*
  echo_command.cpp

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

#include "builtin/echo_command.h"

#include <cctype>

#include "builtin/builtin_help.h"
#include "command_context.h"

namespace {

// byte for a one-character escape, -1 when c is not one
int simple_escape(char c) {
    switch (c) {
        case 'a':
            return '\a';
        case 'b':
            return '\b';
        case 'e':
            return 0x1b;
        case 'f':
            return '\f';
        case 'n':
            return '\n';
        case 'r':
            return '\r';
        case 't':
            return '\t';
        case 'v':
            return '\v';
        case '\\':
            return '\\';
        default:
            return -1;
    }
}

bool is_octal(char c) {
    return c >= '0' && c <= '7';
}

int hex_value(char c) {
    if (std::isdigit(static_cast<unsigned char>(c))) {
        return c - '0';
    }
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

}  // namespace

std::string process_escape_sequences(const std::string& input, bool* stop_output) {
    std::string result;
    size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '\\' || i + 1 >= input.size()) {
            result += input[i++];
            continue;
        }

        const char next = input[i + 1];
        const int simple = simple_escape(next);
        if (simple >= 0) {
            result += static_cast<char>(simple);
            i += 2;
        } else if (next == 'c') {
            if (stop_output != nullptr) {
                *stop_output = true;
            }
            break;
        } else if (next == '0') {
            // \0NNN, up to three octal digits
            size_t j = i + 2;
            int value = 0;
            while (j < input.size() && j < i + 5 && is_octal(input[j])) {
                value = value * 8 + (input[j] - '0');
                ++j;
            }
            result += static_cast<char>(value);
            i = j;
        } else if (next == 'x' && i + 2 < input.size() &&
                   std::isxdigit(static_cast<unsigned char>(input[i + 2]))) {
            size_t j = i + 2;
            int value = 0;
            while (j < input.size() && j < i + 4 &&
                   std::isxdigit(static_cast<unsigned char>(input[j]))) {
                value = value * 16 + hex_value(input[j]);
                ++j;
            }
            result += static_cast<char>(value);
            i = j;
        } else {
            result += input[i++];
        }
    }
    return result;
}

int echo_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: echo [-n] [-e|-E] [STRING ...]",
                             "Print the arguments separated by single spaces.",
                             "  -n  do not print the trailing newline",
                             "  -e  interpret backslash escapes (\\n \\t \\0NNN \\xHH \\c ...)",
                             "  -E  print backslashes literally (default)"},
                            ctx)) {
        return 0;
    }

    bool newline = true;
    bool escapes = false;

    // option words are only recognized before the first operand, and only
    // when every letter is one of n, e, E
    size_t first = 1;
    for (; first < args.size(); ++first) {
        const std::string& word = args[first];
        if (word.size() < 2 || word[0] != '-' ||
            word.find_first_not_of("neE", 1) != std::string::npos) {
            break;
        }
        for (size_t k = 1; k < word.size(); ++k) {
            if (word[k] == 'n') {
                newline = false;
            } else {
                escapes = word[k] == 'e';
            }
        }
    }

    std::string output;
    bool stopped = false;
    for (size_t i = first; i < args.size() && !stopped; ++i) {
        if (i > first) {
            output += ' ';
        }
        output += escapes ? process_escape_sequences(args[i], &stopped) : args[i];
    }
    if (newline && !stopped) {
        output += '\n';
    }
    ctx.out(output);
    return 0;
}
