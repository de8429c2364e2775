/*
  alias_command.cpp

  This file is part of vsh, a virtual shell

  MIT License

  Copyright (c) 2026 the vsh authors

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/


#include "builtin/alias_command.h"

#include <algorithm>
#include <utility>

#include "builtin/builtin_help.h"
#include "command_context.h"
#include "error_out.h"

namespace {

// alias names may contain anything but '=', quotes and whitespace
bool parse_alias_definition(const std::string& arg, std::string& name, std::string& value) {
    size_t eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    name = arg.substr(0, eq);
    if (name.find_first_of(" \t\n'\"") != std::string::npos) {
        return false;
    }
    value = arg.substr(eq + 1);
    return true;
}

std::string format_alias(const std::string& name, const std::string& value) {
    return "alias " + name + "='" + value + "'\n";
}

}  // namespace

int alias_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: alias [NAME[=VALUE] ...]", "List or define aliases.",
                             "With no operands, display all aliases.",
                             "NAME=VALUE defines an alias, NAME shows its definition."},
                            ctx)) {
        return 0;
    }
    auto& aliases = ctx.session.aliases;
    if (args.size() == 1) {
        std::vector<std::pair<std::string, std::string>> entries(aliases.begin(), aliases.end());
        std::sort(entries.begin(), entries.end());
        std::string output;
        for (const auto& entry : entries) {
            output += format_alias(entry.first, entry.second);
        }
        ctx.out(output);
        return 0;
    }

    bool all_successful = true;
    std::string output;
    for (size_t i = 1; i < args.size(); ++i) {
        std::string name;
        std::string value;
        if (parse_alias_definition(args[i], name, value)) {
            aliases[name] = value;
            continue;
        }
        auto it = aliases.find(args[i]);
        if (it != aliases.end()) {
            output += format_alias(it->first, it->second);
        } else {
            print_error({ErrorType::COMMAND_NOT_FOUND, "alias", args[i] + ": not found", {}}, ctx.err);
            all_successful = false;
        }
    }
    ctx.out(output);
    return all_successful ? 0 : 1;
}

int unalias_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: unalias [-a] NAME [NAME ...]", "Remove one or more aliases.",
                             "-a removes every alias."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "unalias", "not enough arguments", {}}, ctx.err);
        return 1;
    }
    if (args[1] == "-a") {
        ctx.session.aliases.clear();
        return 0;
    }

    bool success = true;
    for (size_t i = 1; i < args.size(); ++i) {
        if (ctx.session.aliases.erase(args[i]) == 0) {
            print_error({ErrorType::COMMAND_NOT_FOUND, "unalias", args[i] + ": not found", {}},
                        ctx.err);
            success = false;
        }
    }
    return success ? 0 : 1;
}
