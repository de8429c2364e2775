#pragma once

#include <string>
#include <vector>

struct CommandContext;

int find_command(const std::vector<std::string>& args, CommandContext& ctx);
int glob_command(const std::vector<std::string>& args, CommandContext& ctx);
