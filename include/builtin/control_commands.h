#pragma once

#include <string>
#include <vector>

struct CommandContext;

int true_command(const std::vector<std::string>& args, CommandContext& ctx);
int false_command(const std::vector<std::string>& args, CommandContext& ctx);

// Marks the session as finished; the front end stops reading input and exits
// with session.exit_status.
int exit_command(const std::vector<std::string>& args, CommandContext& ctx);
int version_command(const std::vector<std::string>& args, CommandContext& ctx);

// Reads the first line of stdin into NAME... (or REPLY). Variables land in the
// running session, so "echo x | read V" is visible afterwards.
int read_command(const std::vector<std::string>& args, CommandContext& ctx);
int sleep_command(const std::vector<std::string>& args, CommandContext& ctx);
