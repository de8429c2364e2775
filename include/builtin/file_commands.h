#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct CommandContext;

int cat_command(const std::vector<std::string>& args, CommandContext& ctx);
int mkdir_command(const std::vector<std::string>& args, CommandContext& ctx);
int rmdir_command(const std::vector<std::string>& args, CommandContext& ctx);
int rm_command(const std::vector<std::string>& args, CommandContext& ctx);
int touch_command(const std::vector<std::string>& args, CommandContext& ctx);
int mv_command(const std::vector<std::string>& args, CommandContext& ctx);
int cp_command(const std::vector<std::string>& args, CommandContext& ctx);
int ln_command(const std::vector<std::string>& args, CommandContext& ctx);
int readlink_command(const std::vector<std::string>& args, CommandContext& ctx);
int stat_command(const std::vector<std::string>& args, CommandContext& ctx);
int chmod_command(const std::vector<std::string>& args, CommandContext& ctx);
int realpath_command(const std::vector<std::string>& args, CommandContext& ctx);
int basename_command(const std::vector<std::string>& args, CommandContext& ctx);
int dirname_command(const std::vector<std::string>& args, CommandContext& ctx);

// Octal ("755") or symbolic ("u+x", "go-w", "a=r") mode applied to current.
bool parse_mode(const std::string& mode_text, std::uint32_t current, std::uint32_t& result);
