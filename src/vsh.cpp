/*
 * This file is part of vsh, a virtual shell
 *
 * MIT License
 *
 * Copyright (c) 2026 the vsh authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

#include "builtin/builtin.h"
#include "error_out.h"
#include "main_loop.h"
#include "session.h"
#include "shell.h"
#include "utils/command_line_parser.h"
#include "utils/config_loader.h"
#include "utils/debug.h"
#include "utils/usage.h"
#include "utils/vsh_filesystem.h"
#include "vfs/inode_store.h"
#include "vfs/virtual_filesystem.h"
#include "vsh.h"

namespace {

std::unique_ptr<vfs::InodeStore> create_store() {
    if (!config::persistence_enabled) {
        debug_msg("store: in-memory");
        return std::make_unique<vfs::MemoryInodeStore>();
    }
    debug_msg("store: %s", config::store_path.c_str());
    return std::make_unique<vfs::JsonFileInodeStore>(config::store_path);
}

int final_status(const Session& session, int status) {
    return session.exit_requested ? session.exit_status : status;
}

void source_rc_file(Shell& shell) {
    const std::string rc_path =
        vfs::VirtualFilesystem::join_path(shell.session().home(), ".vshrc");
    auto inode = shell.filesystem().stat(rc_path);
    if (inode.is_error() || !inode.value().is_file()) {
        return;
    }
    debug_msg("sourcing %s", rc_path.c_str());
    shell.execute("source '" + rc_path + "'", [](const std::string& text) { std::cout << text; },
                  [](const std::string& text) { std::cerr << text; });
}

int handle_non_interactive_mode(Shell& shell, const std::string& script_file) {
    std::string script_content;

    if (!script_file.empty()) {
        auto read_result = vsh_filesystem::FileOperations::read_file_content(script_file);
        if (read_result.is_error()) {
            print_error({ErrorType::FILE_NOT_FOUND,
                         script_file,
                         read_result.error(),
                         {"Check file path and permissions"}});
            return 127;
        }
        script_content = read_result.value();
    } else {
        script_content.assign(std::istreambuf_iterator<char>(std::cin),
                              std::istreambuf_iterator<char>());
    }

    return run_script_text(shell, script_content);
}

}  // namespace

int main(int argc, char* argv[]) {
    config::reset_defaults();

    // the config file is applied first so command line flags win
    auto config_file =
        vsh_config::load_config_file(vsh_filesystem::default_config_file_path().string());
    if (config_file.is_error()) {
        print_error({ErrorType::RUNTIME_ERROR,
                     ErrorSeverity::WARNING,
                     "vsh",
                     config_file.error(),
                     {"Falling back to default settings"}});
    } else {
        vsh_config::apply_to_globals(config_file.value());
    }

    auto parse_result = vsh::CommandLineParser::parse_arguments(argc, argv);
    if (parse_result.should_exit) {
        return parse_result.exit_code;
    }

    if (config::show_version) {
        std::cout << "vsh v" << get_version() << " (git " << VSH_GIT_HASH << ")" << std::endl;
        return 0;
    }
    if (config::show_help) {
        print_usage();
        return 0;
    }

    vfs::VirtualFilesystem fs(create_store());
    auto init_result = fs.initialize();
    if (init_result.is_error()) {
        print_error({ErrorType::RUNTIME_ERROR,
                     ErrorSeverity::CRITICAL,
                     "vsh",
                     "failed to load filesystem: " + init_result.error(),
                     {"Run with --memory to start with a fresh in-memory filesystem"}});
        return 1;
    }

    Session session = Session::create_default(fs);
    if (config_file.is_ok()) {
        vsh_config::apply_to_session(config_file.value(), session);
    }

    CommandRegistry registry = create_builtin_registry();
    Shell shell(fs, session, registry);

    if (config::source_enabled) {
        source_rc_file(shell);
        if (session.exit_requested) {
            return session.exit_status;
        }
    }

    if (config::execute_command) {
        int status = shell.execute(
            config::cmd_to_execute, [](const std::string& text) { std::cout << text; },
            [](const std::string& text) { std::cerr << text; });
        std::cout.flush();
        return final_status(session, status);
    }

    if (!config::interactive_mode) {
        return final_status(session, handle_non_interactive_mode(shell, parse_result.script_file));
    }

    std::cout << "vsh v" << get_version() << " - type 'help' to see available commands" << '\n';
    return main_process_loop(shell);
}
