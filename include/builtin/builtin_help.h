#pragma once

#include <string>
#include <vector>

struct CommandContext;

bool builtin_handle_help(const std::vector<std::string>& args,
                         const std::vector<std::string>& help_lines, CommandContext& ctx);
