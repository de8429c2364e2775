#pragma once

#include <string>

class Shell;
struct Session;

// "USER@vsh:CWD$ " with the home directory shown as '~'
std::string build_prompt(const Session& session);

// Reads lines from std::cin until EOF or the exit builtin; returns the exit status.
int main_process_loop(Shell& shell);

// Runs text one line at a time, streaming output to std::cout/std::cerr.
// Stops early when a line calls exit. Returns the last exit code.
int run_script_text(Shell& shell, const std::string& text);
