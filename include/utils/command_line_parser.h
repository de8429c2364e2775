#pragma once

#include <string>
#include <vector>

namespace vsh {

class CommandLineParser {
   public:
    struct ParseResult {
        std::string script_file;
        std::vector<std::string> script_args;
        int exit_code = 0;
        bool should_exit = false;
    };

    // Sets the config:: flags from argv; anything after the first operand
    // belongs to the script.
    static ParseResult parse_arguments(int argc, char* argv[]);
};

}  // namespace vsh
