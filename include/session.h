#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "utils/vsh_filesystem.h"

namespace vfs {
class VirtualFilesystem;
}

// Per-user interpreter state. Never persisted; every field is rebuilt from
// defaults when a session starts.
struct Session {
    std::string cwd = "/";
    std::unordered_map<std::string, std::string> env;
    std::unordered_map<std::string, std::string> aliases;
    int last_exit_code = 0;
    std::uint32_t uid = 1000;
    std::uint32_t gid = 1000;

    // set by the exit builtin; the front end stops reading input when it sees it
    bool exit_requested = false;
    int exit_status = 0;

    // cwd/PWD = HOME when it exists in fs, otherwise "/"
    static Session create_default(const vfs::VirtualFilesystem& fs);

    std::string get_env(const std::string& name) const;
    void set_env(const std::string& name, const std::string& value);
    std::string home() const;

    std::string resolve_path(const std::string& raw) const;

    vsh_filesystem::Result<void> change_directory(const vfs::VirtualFilesystem& fs,
                                                  const std::string& raw);
};
