#pragma once

#include <string>

std::string trim_trailing_whitespace(std::string s);
std::string trim_leading_whitespace(std::string s);
std::string trim_whitespace(const std::string& s);

inline bool is_word_separator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

bool is_identifier_start(char c);
bool is_identifier_char(char c);
bool is_valid_identifier(const std::string& name);

// NAME=value with NAME a valid identifier; splits into name/value when it matches
bool looks_like_assignment(const std::string& word);
bool split_assignment(const std::string& word, std::string& name, std::string& value);

bool is_comment_line(const std::string& line);
