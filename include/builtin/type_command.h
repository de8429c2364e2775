#pragma once

#include <string>
#include <vector>

struct CommandContext;

int which_command(const std::vector<std::string>& args, CommandContext& ctx);
int type_command(const std::vector<std::string>& args, CommandContext& ctx);
int help_command(const std::vector<std::string>& args, CommandContext& ctx);
