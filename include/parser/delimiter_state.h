#pragma once

#include <cstdint>
#include <string>
#include <vector>

enum class LexState : std::uint8_t {
    Normal,
    InSingleQuote,
    InDoubleQuote,
    Escaped
};

const char* lex_state_name(LexState state);

// Quote/escape tracker shared by every splitter. Characters are fed one at a
// time; a "$(" opener saves the current quoting state and starts a fresh
// Normal context that the matching ')' restores.
struct DelimiterState {
    LexState state = LexState::Normal;
    LexState resume_state = LexState::Normal;
    bool in_backtick = false;
    std::vector<LexState> subst_stack;

    // Advances over text[i] and returns how many characters were consumed (1, or 2 for "$(").
    size_t feed(const std::string& text, size_t i);

    // true when a delimiter at the current position would split the text
    bool at_top_level() const {
        return state == LexState::Normal && subst_stack.empty() && !in_backtick;
    }

    bool unterminated() const {
        return state != LexState::Normal || !subst_stack.empty() || in_backtick;
    }

    void reset();
};
