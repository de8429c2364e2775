#include "parser/delimiter_state.h"

const char* lex_state_name(LexState state) {
    switch (state) {
        case LexState::InSingleQuote:
            return "InSingleQuote";
        case LexState::InDoubleQuote:
            return "InDoubleQuote";
        case LexState::Escaped:
            return "Escaped";
        case LexState::Normal:
        default:
            return "Normal";
    }
}

size_t DelimiterState::feed(const std::string& text, size_t i) {
    const char c = text[i];
    const bool opens_subst = c == '$' && i + 1 < text.size() && text[i + 1] == '(';

    switch (state) {
        case LexState::Escaped:
            state = resume_state;
            return 1;

        case LexState::InSingleQuote:
            if (c == '\'') {
                state = LexState::Normal;
            }
            return 1;

        case LexState::InDoubleQuote:
            if (c == '\\') {
                resume_state = LexState::InDoubleQuote;
                state = LexState::Escaped;
            } else if (c == '"') {
                state = LexState::Normal;
            } else if (opens_subst) {
                subst_stack.push_back(LexState::InDoubleQuote);
                state = LexState::Normal;
                return 2;
            } else if (c == '`') {
                in_backtick = !in_backtick;
            }
            return 1;

        case LexState::Normal:
        default:
            if (c == '\\') {
                resume_state = LexState::Normal;
                state = LexState::Escaped;
            } else if (c == '\'') {
                state = LexState::InSingleQuote;
            } else if (c == '"') {
                state = LexState::InDoubleQuote;
            } else if (opens_subst) {
                subst_stack.push_back(LexState::Normal);
                return 2;
            } else if (c == '(' && !subst_stack.empty()) {
                // plain parens nest inside a substitution body
                subst_stack.push_back(LexState::Normal);
            } else if (c == ')' && !subst_stack.empty()) {
                state = subst_stack.back();
                subst_stack.pop_back();
            } else if (c == '`') {
                in_backtick = !in_backtick;
            }
            return 1;
    }
}

void DelimiterState::reset() {
    *this = {};
}
