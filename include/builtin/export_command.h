#pragma once

#include <string>
#include <vector>

struct CommandContext;

int export_command(const std::vector<std::string>& args, CommandContext& ctx);
int unset_command(const std::vector<std::string>& args, CommandContext& ctx);
int env_command(const std::vector<std::string>& args, CommandContext& ctx);
int printenv_command(const std::vector<std::string>& args, CommandContext& ctx);
