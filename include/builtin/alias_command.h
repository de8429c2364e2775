#pragma once

#include <string>
#include <vector>

struct CommandContext;

int alias_command(const std::vector<std::string>& args, CommandContext& ctx);
int unalias_command(const std::vector<std::string>& args, CommandContext& ctx);
