#include "builtin/export_command.h"

#include <algorithm>
#include <utility>

#include "builtin/builtin_help.h"
#include "command_context.h"
#include "error_out.h"
#include "parser/parser_utils.h"

namespace {

std::vector<std::pair<std::string, std::string>> sorted_env(const Session& session) {
    std::vector<std::pair<std::string, std::string>> entries(session.env.begin(),
                                                             session.env.end());
    std::sort(entries.begin(), entries.end());
    return entries;
}

}  // namespace

int export_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: export [NAME[=VALUE] ...]",
                             "Set environment variables for this session.",
                             "With no operands, print every variable as 'export NAME=\"VALUE\"'."},
                            ctx)) {
        return 0;
    }
    if (args.size() == 1) {
        std::string output;
        for (const auto& entry : sorted_env(ctx.session)) {
            output += "export " + entry.first + "=\"" + entry.second + "\"\n";
        }
        ctx.out(output);
        return 0;
    }

    int status = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        std::string name;
        std::string value;
        if (split_assignment(args[i], name, value)) {
            ctx.session.set_env(name, value);
        } else if (is_valid_identifier(args[i])) {
            // NAME alone keeps an existing value and defines a missing one as empty
            if (ctx.session.env.find(args[i]) == ctx.session.env.end()) {
                ctx.session.set_env(args[i], "");
            }
        } else {
            print_error({ErrorType::INVALID_ARGUMENT, "export", "'" + args[i] + "': not a valid identifier", {}},
                        ctx.err);
            status = 1;
        }
    }
    return status;
}

int unset_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: unset NAME ...", "Remove environment variables."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "unset", "not enough arguments", {}}, ctx.err);
        return 1;
    }
    int status = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        if (!is_valid_identifier(args[i])) {
            print_error({ErrorType::INVALID_ARGUMENT, "unset", "'" + args[i] + "': not a valid identifier", {}},
                        ctx.err);
            status = 1;
            continue;
        }
        ctx.session.env.erase(args[i]);
    }
    return status;
}

int env_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: env", "Print the session environment, one NAME=VALUE per line."},
                            ctx)) {
        return 0;
    }
    if (args.size() > 1) {
        print_error({ErrorType::INVALID_ARGUMENT, "env", "running commands is not supported", {}},
                    ctx.err);
        return 2;
    }
    std::string output;
    for (const auto& entry : sorted_env(ctx.session)) {
        output += entry.first + "=" + entry.second + "\n";
    }
    ctx.out(output);
    return 0;
}

int printenv_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: printenv [NAME ...]",
                             "Print the values of the named variables, or the whole environment.",
                             "Exit status is 1 when any NAME is not set."},
                            ctx)) {
        return 0;
    }
    if (args.size() == 1) {
        return env_command(args, ctx);
    }
    int status = 0;
    std::string output;
    for (size_t i = 1; i < args.size(); ++i) {
        auto it = ctx.session.env.find(args[i]);
        if (it == ctx.session.env.end()) {
            status = 1;
            continue;
        }
        output += it->second + "\n";
    }
    ctx.out(output);
    return status;
}
