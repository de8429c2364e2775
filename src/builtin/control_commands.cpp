#include "builtin/control_commands.h"

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <thread>

#include "builtin/builtin_help.h"
#include "builtin/builtin_utils.h"
#include "command_context.h"
#include "error_out.h"
#include "parser/parser_utils.h"
#include "vsh.h"

int true_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: true", "Do nothing, successfully."}, ctx)) {
        return 0;
    }
    return 0;
}

int false_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: false", "Do nothing, unsuccessfully."}, ctx)) {
        return 0;
    }
    return 1;
}

int exit_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: exit [N]",
                                   "Exit the shell with status N (default last command)."},
                            ctx)) {
        return 0;
    }
    if (args.size() > 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "exit", "too many arguments", {}}, ctx.err);
        return 1;
    }

    int exit_code = ctx.session.last_exit_code;
    if (args.size() == 2) {
        long long code = 0;
        if (!builtin_utils::parse_int(args[1], code)) {
            print_error({ErrorType::INVALID_ARGUMENT, "exit", args[1] + ": numeric argument required", {}},
                        ctx.err);
            exit_code = 2;
        } else {
            exit_code = static_cast<int>(code & 0xFF);
        }
    }

    ctx.session.exit_requested = true;
    ctx.session.exit_status = exit_code;
    return exit_code;
}

int version_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: version", "Print the vsh version."}, ctx)) {
        return 0;
    }
    ctx.out("vsh v" + get_version() + " (git " + VSH_GIT_HASH + ")\n");
    return 0;
}

int read_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: read [-r] [-p PROMPT] [NAME ...]",
                             "Read one line of standard input and split it into words.",
                             "Each NAME gets one word and the last NAME gets the rest of the line.",
                             "With no NAME the line is stored in REPLY.",
                             "-r keeps backslashes literally, -p writes PROMPT to stderr first.",
                             "Exit status is 1 when no input is available."},
                            ctx)) {
        return 0;
    }

    bool raw = false;
    std::string prompt;
    size_t i = 1;
    for (; i < args.size(); ++i) {
        if (args[i] == "-r") {
            raw = true;
        } else if (args[i] == "-p") {
            if (i + 1 >= args.size()) {
                print_error({ErrorType::INVALID_ARGUMENT, "read", "-p: option requires an argument", {}},
                            ctx.err);
                return 2;
            }
            prompt = args[++i];
        } else if (args[i] == "--") {
            ++i;
            break;
        } else {
            break;
        }
    }
    std::vector<std::string> names(args.begin() + static_cast<long>(i), args.end());
    for (const auto& name : names) {
        if (!is_valid_identifier(name)) {
            print_error({ErrorType::INVALID_ARGUMENT, "read", "'" + name + "': not a valid identifier", {}},
                        ctx.err);
            return 2;
        }
    }
    if (!prompt.empty()) {
        ctx.err(prompt);
    }

    if (!ctx.stdin_data || ctx.stdin_data->empty()) {
        for (const auto& name : names) {
            ctx.session.set_env(name, "");
        }
        return 1;
    }

    const std::string& input = *ctx.stdin_data;
    std::string line = input.substr(0, input.find('\n'));
    if (!raw) {
        std::string unescaped;
        for (size_t k = 0; k < line.size(); ++k) {
            if (line[k] == '\\' && k + 1 < line.size()) {
                ++k;
            }
            unescaped += line[k];
        }
        line = unescaped;
    }

    if (names.empty()) {
        ctx.session.set_env("REPLY", line);
        return 0;
    }

    size_t pos = line.find_first_not_of(" \t");
    for (size_t n = 0; n < names.size(); ++n) {
        std::string value;
        if (pos != std::string::npos) {
            if (n + 1 == names.size()) {
                value = trim_whitespace(line.substr(pos));
                pos = std::string::npos;
            } else {
                size_t end = line.find_first_of(" \t", pos);
                value = line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
                pos = end == std::string::npos ? end : line.find_first_not_of(" \t", end);
            }
        }
        ctx.session.set_env(names[n], value);
    }
    return 0;
}

int sleep_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: sleep NUMBER[SUFFIX] ...",
                             "Pause for the sum of the given durations.",
                             "SUFFIX is s (seconds, default), m (minutes), h (hours) or d (days)."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "sleep", "missing operand", {"Usage: sleep NUMBER[SUFFIX]"}},
                    ctx.err);
        return 1;
    }

    double total = 0;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        char* end = nullptr;
        double value = std::strtod(arg.c_str(), &end);
        double scale = 1;
        if (end != arg.c_str() && *end != '\0' && end[1] == '\0') {
            switch (*end) {
                case 's':
                    scale = 1;
                    ++end;
                    break;
                case 'm':
                    scale = 60;
                    ++end;
                    break;
                case 'h':
                    scale = 3600;
                    ++end;
                    break;
                case 'd':
                    scale = 86400;
                    ++end;
                    break;
                default:
                    break;
            }
        }
        if (arg.empty() || end == arg.c_str() || *end != '\0' || !std::isfinite(value) ||
            value < 0) {
            print_error({ErrorType::INVALID_ARGUMENT, "sleep", "invalid time interval '" + arg + "'", {}},
                        ctx.err);
            return 1;
        }
        total += value * scale;
    }

    std::this_thread::sleep_for(std::chrono::duration<double>(total));
    return 0;
}
