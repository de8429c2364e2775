#include "parser/parser_utils.h"

#include <cctype>

std::string trim_trailing_whitespace(std::string s) {
    while (!s.empty() && is_word_separator(s.back())) {
        s.pop_back();
    }
    return s;
}

std::string trim_leading_whitespace(std::string s) {
    size_t start = 0;
    while (start < s.size() && is_word_separator(s[start])) {
        ++start;
    }
    return s.substr(start);
}

std::string trim_whitespace(const std::string& s) {
    return trim_leading_whitespace(trim_trailing_whitespace(s));
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_valid_identifier(const std::string& name) {
    if (name.empty() || !is_identifier_start(name[0])) {
        return false;
    }
    for (char c : name) {
        if (!is_identifier_char(c)) {
            return false;
        }
    }
    return true;
}

bool looks_like_assignment(const std::string& word) {
    std::string name;
    std::string value;
    return split_assignment(word, name, value);
}

bool split_assignment(const std::string& word, std::string& name, std::string& value) {
    size_t eq = word.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    std::string candidate = word.substr(0, eq);
    if (!is_valid_identifier(candidate)) {
        return false;
    }
    name = candidate;
    value = word.substr(eq + 1);
    return true;
}

bool is_comment_line(const std::string& line) {
    std::string trimmed = trim_leading_whitespace(line);
    return !trimmed.empty() && trimmed[0] == '#';
}
