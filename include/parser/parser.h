#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "parser/tokenizer.h"
#include "utils/vsh_filesystem.h"

struct Redirect {
    enum class Kind : std::uint8_t {
        Input,        // <
        Output,       // >
        Append,       // >>
        Error,        // 2>
        ErrorAppend   // 2>>
    };

    Kind kind = Kind::Output;
    std::string target;

    bool is_stdout() const {
        return kind == Kind::Output || kind == Kind::Append;
    }
    bool is_stderr() const {
        return kind == Kind::Error || kind == Kind::ErrorAppend;
    }
    bool appends() const {
        return kind == Kind::Append || kind == Kind::ErrorAppend;
    }
};

const char* redirect_operator(Redirect::Kind kind);

// One pipeline segment with its redirects lifted out of the text.
struct Command {
    std::string text;
    std::vector<Redirect> redirects;
};

// op is the operator that follows command ("&&", "||", or empty for the last part)
struct LogicalCommand {
    std::string command;
    std::string op;
};

class Parser {
   public:
    static std::vector<std::string> parse_semicolon_commands(const std::string& line);
    static std::vector<LogicalCommand> parse_logical_commands(const std::string& statement);
    static std::vector<std::string> parse_pipeline(const std::string& part);

    // Fails with InvalidArgument on an operator without a target.
    static vsh_filesystem::Result<Command> parse_redirects(const std::string& segment);
};
