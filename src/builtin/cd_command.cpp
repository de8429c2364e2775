/*
  cd_command.cpp

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


#include "builtin/cd_command.h"

#include "builtin/builtin_help.h"
#include "command_context.h"
#include "error_out.h"

int cd_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: cd [DIR]", "Change the current directory.",
                             "Use '-' to switch to the previous directory."},
                            ctx)) {
        return 0;
    }
    if (args.size() > 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "cd", "too many arguments", {}}, ctx.err);
        return 2;
    }

    std::string target = args.size() > 1 ? args[1] : ctx.session.home();
    bool print_new_dir = false;
    if (target == "-") {
        target = ctx.session.get_env("OLDPWD");
        if (target.empty()) {
            print_error({ErrorType::RUNTIME_ERROR, "cd", "OLDPWD not set", {}}, ctx.err);
            return 1;
        }
        print_new_dir = true;
    }

    auto result = ctx.session.change_directory(ctx.fs, target);
    if (result.is_error()) {
        print_error("cd", result, ctx.err);
        return 1;
    }
    if (print_new_dir) {
        ctx.out(ctx.session.cwd + "\n");
    }
    return 0;
}

int pwd_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: pwd", "Print the current working directory."}, ctx)) {
        return 0;
    }
    ctx.out(ctx.session.cwd + "\n");
    return 0;
}
