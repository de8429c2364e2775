#pragma once

#include <functional>
#include <optional>
#include <string>

#include "command_context.h"

class CommandSubstitutionEvaluator {
   public:
    struct ExpansionResult {
        std::string text;
        // stderr of every substituted command, in order
        std::string stderr_text;
    };
    using CommandExecutor = std::function<ExecResult(const std::string&)>;

    explicit CommandSubstitutionEvaluator(CommandExecutor executor);

    // Replaces each $(...) and `...` outside single quotes with the output of
    // the enclosed command, minus one trailing newline. Unterminated forms are
    // copied literally.
    ExpansionResult expand_substitutions(const std::string& input);

    // index of the ')' closing the '(' at open_index
    static std::optional<size_t> find_matching_paren(const std::string& text, size_t open_index);
    static std::optional<size_t> find_closing_backtick(const std::string& text, size_t open_index);

   private:
    void append_substitution_result(const std::string& content, bool in_double_quotes,
                                    std::string& output);
    std::string capture_command_output(const std::string& command, ExpansionResult& result);

    CommandExecutor command_executor_;
};
