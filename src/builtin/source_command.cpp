#include "builtin/source_command.h"

#include <algorithm>

#include "builtin/builtin_help.h"
#include "builtin/builtin_utils.h"
#include "command_context.h"
#include "error_out.h"
#include "parser/parser_utils.h"
#include "utils/debug.h"
#include "utils/string_utils.h"
#include "vfs/virtual_filesystem.h"

namespace {

// wraps a word so the tokenizer hands it back unchanged and the expander leaves it alone
std::string quote_word(const std::string& word) {
    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string build_command_line(const std::vector<std::string>& words) {
    std::vector<std::string> quoted;
    quoted.reserve(words.size());
    for (const auto& word : words) {
        quoted.push_back(quote_word(word));
    }
    return string_utils::join(quoted, " ");
}

std::string replace_all(std::string text, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return text;
    }
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

int run_and_forward(const ExecHook& hook, CommandContext& ctx, const std::string& line) {
    ExecResult result = hook(line);
    if (!result.stdout_text.empty()) {
        ctx.out(result.stdout_text);
    }
    if (!result.stderr_text.empty()) {
        ctx.err(result.stderr_text);
    }
    return result.exit_code;
}

}  // namespace

int source_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: source FILE",
                             "Execute each line of FILE in the current session.",
                             "Blank lines and lines starting with '#' are skipped."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, args[0], "missing file operand", {"Usage: source FILE"}},
                    ctx.err);
        return 2;
    }
    if (!ctx.exec) {
        print_error({ErrorType::RUNTIME_ERROR, args[0], "no interpreter available", {}}, ctx.err);
        return 1;
    }

    auto content = ctx.fs.read_file(ctx.resolve(args[1]));
    if (content.is_error()) {
        print_error(args[0], content, ctx.err);
        return 1;
    }

    debug_msg("source: running %s", args[1].c_str());
    int status = 0;
    for (const auto& raw_line : string_utils::split_lines(content.value())) {
        std::string line = trim_whitespace(raw_line);
        if (line.empty() || is_comment_line(line)) {
            continue;
        }
        status = run_and_forward(ctx.exec, ctx, line);
        if (ctx.session.exit_requested) {
            break;
        }
    }
    return status;
}

int xargs_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: xargs [-n N] [-I STR] [-d DELIM] [-0] [COMMAND [ARG ...]]",
                             "Build command lines from standard input and run them.",
                             "Items are separated by newlines unless -d or -0 is given.",
                             "-n N passes at most N items per command.",
                             "-I STR runs COMMAND once per item, replacing STR in each argument.",
                             "COMMAND defaults to echo."},
                            ctx)) {
        return 0;
    }

    long long max_items = 0;
    std::string replace;
    char delimiter = '\n';
    size_t i = 1;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg == "-0") {
            delimiter = '\0';
            continue;
        }
        if (arg == "-n" || arg == "-I" || arg == "-d") {
            if (i + 1 >= args.size()) {
                print_error({ErrorType::INVALID_ARGUMENT, "xargs", "option requires an argument -- '" + arg.substr(1) + "'", {}},
                            ctx.err);
                return 1;
            }
            const std::string& value = args[++i];
            if (arg == "-n") {
                if (!builtin_utils::parse_int(value, max_items) || max_items <= 0) {
                    print_error({ErrorType::INVALID_ARGUMENT, "xargs", "invalid number for -n option: '" + value + "'", {}},
                                ctx.err);
                    return 1;
                }
            } else if (arg == "-I") {
                replace = value;
            } else {
                delimiter = value.empty() ? '\n' : value[0];
            }
            continue;
        }
        break;
    }

    std::vector<std::string> command(args.begin() + static_cast<long>(i), args.end());
    if (command.empty()) {
        command.push_back("echo");
    }

    if (!ctx.stdin_data) {
        print_error({ErrorType::INVALID_ARGUMENT, "xargs", "no stdin", {}}, ctx.err);
        return 1;
    }
    if (!ctx.exec_isolated) {
        print_error({ErrorType::RUNTIME_ERROR, "xargs", "no interpreter available", {}}, ctx.err);
        return 1;
    }

    std::vector<std::string> items;
    for (const auto& item : string_utils::split(*ctx.stdin_data, delimiter)) {
        std::string trimmed = trim_whitespace(item);
        if (!trimmed.empty()) {
            items.push_back(trimmed);
        }
    }
    if (items.empty()) {
        return 0;
    }

    int status = 0;
    if (!replace.empty()) {
        for (const auto& item : items) {
            std::vector<std::string> words;
            for (const auto& word : command) {
                words.push_back(replace_all(word, replace, item));
            }
            status = run_and_forward(ctx.exec_isolated, ctx, build_command_line(words));
        }
        return status;
    }

    size_t batch = max_items > 0 ? static_cast<size_t>(max_items) : items.size();
    for (size_t start = 0; start < items.size(); start += batch) {
        std::vector<std::string> words = command;
        size_t end = std::min(items.size(), start + batch);
        words.insert(words.end(), items.begin() + static_cast<long>(start),
                     items.begin() + static_cast<long>(end));
        status = run_and_forward(ctx.exec_isolated, ctx, build_command_line(words));
    }
    return status;
}
