/*
  tokenizer.cpp

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


#include "parser/tokenizer.h"

#include "parser/delimiter_state.h"
#include "parser/parser_utils.h"
#include "utils/debug.h"

namespace {

inline bool is_glob_char(char c) {
    return c == '*' || c == '?';
}

// inside double quotes a backslash only escapes these; before anything else it is literal
inline bool escapable_in_double_quotes(char c) {
    return c == '$' || c == '`' || c == '"' || c == '\\' || c == '\n';
}

}  // namespace

std::vector<Word> Tokenizer::tokenize_words(const std::string& cmdline) {
    std::vector<Word> words;
    std::string current;
    current.reserve(64);

    LexState state = LexState::Normal;
    LexState resume = LexState::Normal;
    bool has_word = false;
    bool unquoted_glob = false;
    bool quoted_glob = false;

    auto flush_current_word = [&]() {
        if (!has_word) {
            return;
        }
        Word word;
        word.text = current;
        word.glob_candidate = unquoted_glob && !quoted_glob;
        words.push_back(std::move(word));
        current.clear();
        has_word = false;
        unquoted_glob = false;
        quoted_glob = false;
    };

    for (char c : cmdline) {
        switch (state) {
            case LexState::Escaped:
                if (resume == LexState::InDoubleQuote && !escapable_in_double_quotes(c)) {
                    current += '\\';
                }
                current += c;
                has_word = true;
                quoted_glob = quoted_glob || is_glob_char(c);
                state = resume;
                break;

            case LexState::InSingleQuote:
                if (c == '\'') {
                    state = LexState::Normal;
                } else {
                    current += c;
                    quoted_glob = quoted_glob || is_glob_char(c);
                }
                break;

            case LexState::InDoubleQuote:
                if (c == '\\') {
                    resume = LexState::InDoubleQuote;
                    state = LexState::Escaped;
                } else if (c == '"') {
                    state = LexState::Normal;
                } else {
                    current += c;
                    quoted_glob = quoted_glob || is_glob_char(c);
                }
                break;

            case LexState::Normal:
            default:
                if (is_word_separator(c)) {
                    flush_current_word();
                } else if (c == '\\') {
                    resume = LexState::Normal;
                    state = LexState::Escaped;
                } else if (c == '\'') {
                    state = LexState::InSingleQuote;
                    has_word = true;
                } else if (c == '"') {
                    state = LexState::InDoubleQuote;
                    has_word = true;
                } else {
                    current += c;
                    has_word = true;
                    unquoted_glob = unquoted_glob || is_glob_char(c);
                }
                break;
        }
    }

    // a trailing lone backslash escapes nothing and is dropped;
    // an open quote runs to the end of the input
    if (state == LexState::InSingleQuote || state == LexState::InDoubleQuote) {
        debug_msg("tokenizer: unterminated quote (%s), consuming to end of input",
                  lex_state_name(state));
    }
    flush_current_word();
    return words;
}

std::vector<std::string> Tokenizer::tokenize_command(const std::string& cmdline) {
    std::vector<std::string> tokens;
    for (auto& word : tokenize_words(cmdline)) {
        tokens.push_back(std::move(word.text));
    }
    return tokens;
}
