#pragma once

#include <string>
#include <vector>

struct CommandContext;

int cd_command(const std::vector<std::string>& args, CommandContext& ctx);
int pwd_command(const std::vector<std::string>& args, CommandContext& ctx);
