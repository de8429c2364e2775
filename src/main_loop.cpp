#include "main_loop.h"

#include <iostream>

#include "parser/parser_utils.h"
#include "session.h"
#include "shell.h"
#include "utils/debug.h"
#include "utils/string_utils.h"

namespace {

void write_out(const std::string& text) {
    std::cout << text << std::flush;
}

void write_err(const std::string& text) {
    std::cerr << text << std::flush;
}

int execute_line(Shell& shell, const std::string& line) {
    return shell.execute(line, write_out, write_err);
}

}  // namespace

std::string build_prompt(const Session& session) {
    std::string user = session.get_env("USER");
    if (user.empty()) {
        user = "user";
    }
    std::string display = session.cwd;
    const std::string home = session.home();
    if (!home.empty() && home != "/") {
        if (display == home) {
            display = "~";
        } else if (string_utils::starts_with(display, home + "/")) {
            display = "~" + display.substr(home.size());
        }
    }
    return user + "@vsh:" + display + "$ ";
}

int run_script_text(Shell& shell, const std::string& text) {
    int status = 0;
    for (const auto& line : string_utils::split_lines(text)) {
        if (trim_whitespace(line).empty()) {
            continue;
        }
        status = execute_line(shell, line);
        if (shell.session().exit_requested) {
            return shell.session().exit_status;
        }
    }
    return status;
}

int main_process_loop(Shell& shell) {
    Session& session = shell.session();
    std::string line;
    while (true) {
        std::cout << build_prompt(session) << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << '\n';
            break;
        }
        if (trim_whitespace(line).empty()) {
            continue;
        }
        PerformanceTracker tracker("repl line");
        execute_line(shell, line);
        if (session.exit_requested) {
            return session.exit_status;
        }
    }
    return session.last_exit_code;
}
