#pragma once

#include <functional>
#include <optional>
#include <string>

#include "session.h"

class CommandRegistry;

namespace vfs {
class VirtualFilesystem;
}

using OutputSink = std::function<void(const std::string&)>;

struct ExecResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

// runs a full command line with the caller's session and filesystem
using ExecHook = std::function<ExecResult(const std::string&)>;

// Everything a command handler may touch. stdin_data is empty (nullopt) when
// the command is the first stage with no piped or redirected input.
struct CommandContext {
    CommandContext(vfs::VirtualFilesystem& filesystem, Session& shell_session)
        : fs(filesystem), session(shell_session) {
    }

    std::optional<std::string> stdin_data;
    OutputSink out;
    OutputSink err;
    vfs::VirtualFilesystem& fs;
    Session& session;
    ExecHook exec;
    // like exec, but an exit inside the line does not end the caller's session
    ExecHook exec_isolated;
    const CommandRegistry* registry = nullptr;

    std::string resolve(const std::string& raw) const {
        return session.resolve_path(raw);
    }

    std::string read_stdin() const {
        return stdin_data.value_or("");
    }
};
