#include "builtin/builtin_help.h"

#include "command_context.h"

bool builtin_handle_help(const std::vector<std::string>& args,
                         const std::vector<std::string>& help_lines, CommandContext& ctx) {
    if (args.size() > 1) {
        const std::string& flag = args[1];
        if (flag == "--help" || flag == "-h") {
            for (const auto& line : help_lines) {
                ctx.out(line + "\n");
            }
            return true;
        }
    }
    return false;
}
