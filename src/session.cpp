#include "session.h"

#include "vfs/virtual_filesystem.h"

using vsh_filesystem::ErrorKind;
using vsh_filesystem::Result;

Session Session::create_default(const vfs::VirtualFilesystem& fs) {
    Session session;
    session.env = {{"HOME", "/home/user"},       {"USER", "user"},
                   {"PATH", "/usr/bin:/bin"},    {"SHELL", "/bin/vsh"},
                   {"TERM", "xterm-256color"},   {"LANG", "en_US.UTF-8"}};

    auto home = fs.stat(session.home());
    if (home.is_ok() && home.value().is_directory()) {
        session.cwd = session.home();
    }
    session.env["PWD"] = session.cwd;
    session.env["OLDPWD"] = session.cwd;
    return session;
}

std::string Session::get_env(const std::string& name) const {
    auto it = env.find(name);
    if (it == env.end()) {
        return "";
    }
    return it->second;
}

void Session::set_env(const std::string& name, const std::string& value) {
    env[name] = value;
}

std::string Session::home() const {
    auto it = env.find("HOME");
    if (it == env.end() || it->second.empty()) {
        return "/";
    }
    return it->second;
}

std::string Session::resolve_path(const std::string& raw) const {
    return vfs::VirtualFilesystem::resolve_path(raw, cwd, home());
}

Result<void> Session::change_directory(const vfs::VirtualFilesystem& fs, const std::string& raw) {
    const std::string target = resolve_path(raw);
    auto node = fs.stat(target);
    if (node.is_error()) {
        return Result<void>::error(node.kind(), node.error());
    }
    if (!node.value().is_directory()) {
        return vsh_filesystem::fail(ErrorKind::NotADirectory, target);
    }

    // the logical path is kept, so "cd link" shows the link name in PWD
    env["OLDPWD"] = cwd;
    cwd = target;
    env["PWD"] = cwd;
    return Result<void>::ok();
}
