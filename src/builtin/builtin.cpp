#include "builtin/builtin.h"

#include <algorithm>
#include <stdexcept>

#include "builtin/alias_command.h"
#include "builtin/cd_command.h"
#include "builtin/control_commands.h"
#include "builtin/echo_command.h"
#include "builtin/export_command.h"
#include "builtin/file_commands.h"
#include "builtin/find_command.h"
#include "builtin/ls_command.h"
#include "builtin/source_command.h"
#include "builtin/test_command.h"
#include "builtin/text_commands.h"
#include "builtin/type_command.h"

CommandRegistry::CommandRegistry(std::vector<BuiltinCommand> commands)
    : commands_(std::move(commands)) {
    std::sort(commands_.begin(), commands_.end(),
              [](const BuiltinCommand& a, const BuiltinCommand& b) { return a.name < b.name; });
    for (size_t i = 0; i < commands_.size(); ++i) {
        if (!index_.emplace(commands_[i].name, i).second) {
            throw std::invalid_argument("duplicate builtin: " + commands_[i].name);
        }
    }
}

const BuiltinCommand* CommandRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &commands_[it->second];
}

CommandRegistry create_builtin_registry() {
    return CommandRegistry({
        {"echo", ::echo_command, "print arguments"},
        {"true", ::true_command, "exit successfully"},
        {"false", ::false_command, "exit with status 1"},
        {"pwd", ::pwd_command, "print the working directory"},
        {"cd", ::cd_command, "change the working directory"},
        {"ls", ::ls_command, "list directory contents"},
        {"cat", ::cat_command, "concatenate files to standard output"},
        {"mkdir", ::mkdir_command, "create directories"},
        {"rmdir", ::rmdir_command, "remove empty directories"},
        {"rm", ::rm_command, "remove files or directory trees"},
        {"touch", ::touch_command, "create files or update timestamps"},
        {"mv", ::mv_command, "move or rename files"},
        {"cp", ::cp_command, "copy files and directories"},
        {"ln", ::ln_command, "create symbolic links"},
        {"readlink", ::readlink_command, "print a symbolic link's target"},
        {"stat", ::stat_command, "show inode metadata"},
        {"chmod", ::chmod_command, "change permission bits"},
        {"realpath", ::realpath_command, "print canonical paths"},
        {"basename", ::basename_command, "strip directory from a path"},
        {"dirname", ::dirname_command, "strip the last component from a path"},
        {"glob", ::glob_command, "print paths matching a glob pattern"},
        {"find", ::find_command, "search a directory tree"},
        {"grep", ::grep_command, "print lines matching a pattern"},
        {"head", ::head_command, "print the first lines of input"},
        {"tail", ::tail_command, "print the last lines of input"},
        {"wc", ::wc_command, "count lines, words and bytes"},
        {"sort", ::sort_command, "sort lines"},
        {"uniq", ::uniq_command, "collapse adjacent duplicate lines"},
        {"tee", ::tee_command, "copy input to output and files"},
        {"seq", ::seq_command, "print a number sequence"},
        {"printf", ::printf_command, "format and print data"},
        {"read", ::read_command, "read a line into a variable"},
        {"sleep", ::sleep_command, "pause for a number of seconds"},
        {"export", ::export_command, "set environment variables"},
        {"unset", ::unset_command, "remove environment variables"},
        {"env", ::env_command, "print the environment"},
        {"printenv", ::printenv_command, "print environment values"},
        {"alias", ::alias_command, "define or list aliases"},
        {"unalias", ::unalias_command, "remove aliases"},
        {"which", ::which_command, "locate a command"},
        {"type", ::type_command, "describe a command name"},
        {"help", ::help_command, "list builtin commands"},
        {"source", ::source_command, "run commands from a file"},
        {".", ::source_command, "run commands from a file"},
        {"xargs", ::xargs_command, "build command lines from input"},
        {"test", ::test_command, "evaluate a conditional expression"},
        {"[", ::test_command, "evaluate a conditional expression"},
        {"exit", ::exit_command, "exit the shell"},
        {"version", ::version_command, "print the vsh version"},
    });
}
