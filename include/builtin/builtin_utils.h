#pragma once

#include <set>
#include <string>
#include <vector>

struct CommandContext;

namespace builtin_utils {

struct ParsedArgs {
    std::set<char> flags;
    std::vector<std::string> operands;
};

// Collects single-letter flags from args[1..] until "--" or the first operand.
// Unknown letters are reported as "<command>: invalid option -- 'x'" and make
// the call return false.
bool parse_flags(const std::vector<std::string>& args, const std::string& allowed,
                 ParsedArgs& parsed, CommandContext& ctx);

// Concatenated contents of files, or stdin when files is empty; "-" also names stdin.
// Unreadable files are reported and flip ok to false.
std::string read_inputs(const std::vector<std::string>& files, CommandContext& ctx,
                        const std::string& command, bool& ok);

bool parse_int(const std::string& text, long long& value);

}  // namespace builtin_utils
