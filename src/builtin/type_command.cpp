#include "builtin/type_command.h"

#include <algorithm>

#include "builtin/builtin.h"
#include "builtin/builtin_help.h"
#include "command_context.h"
#include "error_out.h"

namespace {

bool is_builtin(const CommandContext& ctx, const std::string& name) {
    return ctx.registry != nullptr && ctx.registry->contains(name);
}

}  // namespace

int which_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: which NAME ...",
                             "Print '<NAME>: vsh builtin' for every registered command."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "which", "missing command name", {}}, ctx.err);
        return 1;
    }
    int status = 0;
    std::string output;
    for (size_t i = 1; i < args.size(); ++i) {
        if (is_builtin(ctx, args[i])) {
            output += args[i] + ": vsh builtin\n";
        } else {
            print_error({ErrorType::COMMAND_NOT_FOUND, "which", "no " + args[i] + " in vsh", {}}, ctx.err);
            status = 1;
        }
    }
    ctx.out(output);
    return status;
}

int type_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: type NAME ...",
                             "Describe how each NAME would be interpreted: alias or builtin."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "type", "missing command name", {}}, ctx.err);
        return 1;
    }
    int status = 0;
    std::string output;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& name = args[i];
        auto alias = ctx.session.aliases.find(name);
        if (alias != ctx.session.aliases.end()) {
            output += name + " is aliased to '" + alias->second + "'\n";
        } else if (is_builtin(ctx, name)) {
            output += name + " is a shell builtin\n";
        } else {
            print_error({ErrorType::COMMAND_NOT_FOUND, "type", name + ": not found", {}}, ctx.err);
            status = 1;
        }
    }
    ctx.out(output);
    return status;
}

int help_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: help", "List every builtin with a one-line summary.",
                             "Run 'COMMAND --help' for details on one command."},
                            ctx)) {
        return 0;
    }
    if (ctx.registry == nullptr) {
        return 1;
    }

    size_t width = 0;
    for (const auto& command : ctx.registry->commands()) {
        width = std::max(width, command.name.size());
    }
    std::string output = "vsh builtins:\n";
    for (const auto& command : ctx.registry->commands()) {
        output += "  " + command.name + std::string(width - command.name.size() + 2, ' ') +
                  command.summary + "\n";
    }
    ctx.out(output);
    return 0;
}
