#pragma once

#include <string>
#include <vector>

struct CommandContext;

// test EXPR and [ EXPR ]: 0 when EXPR is true, 1 when false, 2 on a malformed expression
int test_command(const std::vector<std::string>& args, CommandContext& ctx);
