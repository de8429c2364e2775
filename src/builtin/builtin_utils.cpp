#include "builtin/builtin_utils.h"

#include <cerrno>
#include <cstdlib>

#include "command_context.h"
#include "error_out.h"
#include "vfs/virtual_filesystem.h"

namespace builtin_utils {

bool parse_flags(const std::vector<std::string>& args, const std::string& allowed,
                 ParsedArgs& parsed, CommandContext& ctx) {
    size_t i = 1;
    for (; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') {
            break;
        }
        for (size_t j = 1; j < arg.size(); ++j) {
            if (allowed.find(arg[j]) == std::string::npos) {
                print_error({ErrorType::INVALID_ARGUMENT,
                             args[0],
                             std::string("invalid option -- '") + arg[j] + "'",
                             {"Try '" + args[0] + " --help' for more information."}},
                            ctx.err);
                return false;
            }
            parsed.flags.insert(arg[j]);
        }
    }
    for (; i < args.size(); ++i) {
        parsed.operands.push_back(args[i]);
    }
    return true;
}

std::string read_inputs(const std::vector<std::string>& files, CommandContext& ctx,
                        const std::string& command, bool& ok) {
    ok = true;
    if (files.empty()) {
        return ctx.read_stdin();
    }
    std::string data;
    for (const auto& file : files) {
        if (file == "-") {
            data += ctx.read_stdin();
            continue;
        }
        auto content = ctx.fs.read_file(ctx.resolve(file));
        if (content.is_error()) {
            print_error(command, content, ctx.err);
            ok = false;
            continue;
        }
        data += content.value();
    }
    return data;
}

bool parse_int(const std::string& text, long long& value) {
    if (text.empty()) {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return false;
    }
    value = parsed;
    return true;
}

}  // namespace builtin_utils
