#pragma once

#include <string>
#include <vector>

struct CommandContext;

int source_command(const std::vector<std::string>& args, CommandContext& ctx);
int xargs_command(const std::vector<std::string>& args, CommandContext& ctx);
