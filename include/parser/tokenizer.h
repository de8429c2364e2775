#pragma once

#include <string>
#include <vector>

struct Word {
    std::string text;
    // at least one '*' or '?' appeared unquoted and unescaped, and none appeared quoted
    bool glob_candidate = false;
};

class Tokenizer {
   public:
    // Splits on unquoted whitespace, strips quote delimiters and resolves
    // backslash escapes. Empty quoted words ("" or '') are kept.
    static std::vector<Word> tokenize_words(const std::string& cmdline);
    static std::vector<std::string> tokenize_command(const std::string& cmdline);
};
