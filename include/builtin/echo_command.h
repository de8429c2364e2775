#pragma once

#include <string>
#include <vector>

struct CommandContext;

int echo_command(const std::vector<std::string>& args, CommandContext& ctx);

// Expands echo -e escapes. A \c escape ends the text early and sets *stop_output.
std::string process_escape_sequences(const std::string& input, bool* stop_output = nullptr);
