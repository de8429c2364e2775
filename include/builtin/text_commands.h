#pragma once

#include <string>
#include <vector>

struct CommandContext;

int grep_command(const std::vector<std::string>& args, CommandContext& ctx);
int head_command(const std::vector<std::string>& args, CommandContext& ctx);
int tail_command(const std::vector<std::string>& args, CommandContext& ctx);
int wc_command(const std::vector<std::string>& args, CommandContext& ctx);
int sort_command(const std::vector<std::string>& args, CommandContext& ctx);
int uniq_command(const std::vector<std::string>& args, CommandContext& ctx);
int tee_command(const std::vector<std::string>& args, CommandContext& ctx);
int seq_command(const std::vector<std::string>& args, CommandContext& ctx);
int printf_command(const std::vector<std::string>& args, CommandContext& ctx);
