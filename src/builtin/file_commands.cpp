/*
  file_commands.cpp

  This file is part of vsh, a virtual shell

  MIT License

  Copyright (c) 2026 the vsh authors

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/


#include "builtin/file_commands.h"

#include <cstdio>
#include <ctime>

#include "builtin/builtin_help.h"
#include "builtin/builtin_utils.h"
#include "builtin/ls_command.h"
#include "command_context.h"
#include "error_out.h"
#include "vfs/virtual_filesystem.h"

using builtin_utils::ParsedArgs;
using vfs::VirtualFilesystem;

namespace {

bool require_operands(const ParsedArgs& parsed, size_t count, const std::string& command,
                      CommandContext& ctx) {
    if (parsed.operands.size() >= count) {
        return true;
    }
    print_error({ErrorType::INVALID_ARGUMENT,
                 command,
                 parsed.operands.empty() ? "missing operand" : "missing destination operand",
                 {"Try '" + command + " --help' for more information."}},
                ctx.err);
    return false;
}

bool is_directory(CommandContext& ctx, const std::string& path) {
    auto inode = ctx.fs.stat(path);
    return inode.is_ok() && inode.value().is_directory();
}

std::string format_timestamp(std::int64_t millis) {
    time_t seconds = static_cast<time_t>(millis / 1000);
    struct tm tm_info {};
    localtime_r(&seconds, &tm_info);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_info);
    char with_millis[48];
    snprintf(with_millis, sizeof(with_millis), "%s.%03d", buffer,
             static_cast<int>(millis % 1000));
    return std::string(with_millis);
}

std::string strip_trailing_slashes(std::string path) {
    while (path.size() > 1 && path.back() == '/') {
        path.pop_back();
    }
    return path;
}

}  // namespace

int cat_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: cat [FILE ...]",
                             "Concatenate FILEs to standard output.",
                             "With no FILE, or when FILE is -, read standard input."},
                            ctx)) {
        return 0;
    }
    std::vector<std::string> files(args.begin() + 1, args.end());
    bool ok = true;
    std::string data = builtin_utils::read_inputs(files, ctx, "cat", ok);
    ctx.out(data);
    return ok ? 0 : 1;
}

int mkdir_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: mkdir [-p] DIRECTORY ...",
                             "Create directories.",
                             "-p creates missing parents and ignores existing directories."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "p", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 1, "mkdir", ctx)) {
        return 1;
    }

    const bool parents = parsed.flags.count('p') > 0;
    int status = 0;
    for (const auto& dir : parsed.operands) {
        auto result = ctx.fs.mkdir(ctx.resolve(dir), parents, ctx.session.uid, ctx.session.gid);
        if (result.is_error()) {
            print_error("mkdir", result, ctx.err);
            status = 1;
        }
    }
    return status;
}

int rmdir_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: rmdir DIRECTORY ...", "Remove empty directories."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 1, "rmdir", ctx)) {
        return 1;
    }

    int status = 0;
    for (const auto& dir : parsed.operands) {
        auto result = ctx.fs.rmdir(ctx.resolve(dir), false);
        if (result.is_error()) {
            print_error("rmdir", result, ctx.err);
            status = 1;
        }
    }
    return status;
}

int rm_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: rm [-r] [-f] PATH ...", "Remove files or directories.",
                             "-r removes directories and their contents, -f ignores missing "
                             "paths."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "rRf", parsed, ctx)) {
        return 2;
    }
    const bool recursive = parsed.flags.count('r') > 0 || parsed.flags.count('R') > 0;
    const bool force = parsed.flags.count('f') > 0;
    if (parsed.operands.empty()) {
        if (force) {
            return 0;
        }
        require_operands(parsed, 1, "rm", ctx);
        return 1;
    }

    int status = 0;
    for (const auto& operand : parsed.operands) {
        const std::string path = ctx.resolve(operand);
        auto inode = ctx.fs.lstat(path);
        if (inode.is_error()) {
            if (!force) {
                print_error("rm", inode, ctx.err);
                status = 1;
            }
            continue;
        }

        if (inode.value().is_directory()) {
            if (!recursive) {
                print_error({ErrorType::IS_A_DIRECTORY,
                             "rm",
                             "cannot remove '" + operand + "': Is a directory",
                             {}},
                            ctx.err);
                status = 1;
                continue;
            }
            auto removed = ctx.fs.rmdir(path, true);
            if (removed.is_error()) {
                print_error("rm", removed, ctx.err);
                status = 1;
            }
            continue;
        }

        auto removed = ctx.fs.unlink(path);
        if (removed.is_error()) {
            print_error("rm", removed, ctx.err);
            status = 1;
        }
    }
    return status;
}

int touch_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: touch FILE ...",
                             "Update access and modification times, creating empty files "
                             "as needed."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 1, "touch", ctx)) {
        return 1;
    }

    int status = 0;
    for (const auto& file : parsed.operands) {
        auto result = ctx.fs.touch(ctx.resolve(file), ctx.session.uid, ctx.session.gid);
        if (result.is_error()) {
            print_error("touch", result, ctx.err);
            status = 1;
        }
    }
    return status;
}

int mv_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: mv SOURCE ... DEST", "Rename SOURCE to DEST, or move "
                                                          "SOURCEs into directory DEST."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "f", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 2, "mv", ctx)) {
        return 1;
    }

    const std::string dest = ctx.resolve(parsed.operands.back());
    const bool dest_is_dir = is_directory(ctx, dest);
    if (parsed.operands.size() > 2 && !dest_is_dir) {
        print_error({ErrorType::NOT_A_DIRECTORY,
                     "mv",
                     "target '" + parsed.operands.back() + "' is not a directory",
                     {}},
                    ctx.err);
        return 1;
    }

    int status = 0;
    for (size_t i = 0; i + 1 < parsed.operands.size(); ++i) {
        const std::string source = ctx.resolve(parsed.operands[i]);
        std::string target = dest;
        if (dest_is_dir) {
            target = VirtualFilesystem::join_path(dest, VirtualFilesystem::base_name(source));
        }
        auto result = ctx.fs.rename(source, target);
        if (result.is_error()) {
            print_error("mv", result, ctx.err);
            status = 1;
        }
    }
    return status;
}

int cp_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: cp [-r] SOURCE ... DEST",
                             "Copy SOURCE to DEST, or SOURCEs into directory DEST.",
                             "-r copies directories recursively."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "rRf", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 2, "cp", ctx)) {
        return 1;
    }

    const bool recursive = parsed.flags.count('r') > 0 || parsed.flags.count('R') > 0;
    const std::string dest = ctx.resolve(parsed.operands.back());
    if (parsed.operands.size() > 2 && !is_directory(ctx, dest)) {
        print_error({ErrorType::NOT_A_DIRECTORY,
                     "cp",
                     "target '" + parsed.operands.back() + "' is not a directory",
                     {}},
                    ctx.err);
        return 1;
    }

    int status = 0;
    for (size_t i = 0; i + 1 < parsed.operands.size(); ++i) {
        auto result = ctx.fs.copy(ctx.resolve(parsed.operands[i]), dest, recursive);
        if (result.is_error()) {
            print_error("cp", result, ctx.err);
            status = 1;
        }
    }
    return status;
}

int ln_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: ln -s TARGET LINK_NAME",
                             "Create a symbolic link named LINK_NAME pointing at TARGET."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "sf", parsed, ctx)) {
        return 2;
    }
    if (parsed.flags.count('s') == 0) {
        print_error({ErrorType::INVALID_ARGUMENT, "ln", "hard links are not supported", {"Use ln -s"}},
                    ctx.err);
        return 1;
    }
    if (!require_operands(parsed, 2, "ln", ctx)) {
        return 1;
    }

    const std::string& target = parsed.operands[0];
    std::string link = ctx.resolve(parsed.operands[1]);
    auto existing = ctx.fs.lstat(link);
    if (existing.is_ok()) {
        if (existing.value().is_directory()) {
            link = VirtualFilesystem::join_path(
                link, VirtualFilesystem::base_name(VirtualFilesystem::resolve_path(target)));
        } else if (parsed.flags.count('f') > 0) {
            auto removed = ctx.fs.unlink(link);
            if (removed.is_error()) {
                print_error("ln", removed, ctx.err);
                return 1;
            }
        }
    }

    auto result = ctx.fs.symlink(target, link, ctx.session.uid, ctx.session.gid);
    if (result.is_error()) {
        print_error("ln", result, ctx.err);
        return 1;
    }
    return 0;
}

int readlink_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: readlink LINK", "Print the target of a symbolic link."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 1, "readlink", ctx)) {
        return 1;
    }

    int status = 0;
    for (const auto& operand : parsed.operands) {
        auto target = ctx.fs.readlink(ctx.resolve(operand));
        if (target.is_error()) {
            // readlink is silent on non-links, as coreutils is without -v
            status = 1;
            continue;
        }
        ctx.out(target.value() + "\n");
    }
    return status;
}

int stat_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: stat PATH ...", "Display inode metadata."}, ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 1, "stat", ctx)) {
        return 1;
    }

    int status = 0;
    for (const auto& operand : parsed.operands) {
        auto result = ctx.fs.lstat(ctx.resolve(operand));
        if (result.is_error()) {
            print_error("stat", result, ctx.err);
            status = 1;
            continue;
        }
        const vfs::Inode& inode = result.value();
        char mode[8];
        snprintf(mode, sizeof(mode), "%04o", inode.mode & 07777);

        std::string text = "  File: " + inode.path;
        if (inode.is_symlink()) {
            text += " -> " + inode.content.value_or("");
        }
        text += "\n  Size: " + std::to_string(inode.size) +
                "\tType: " + vfs::inode_type_name(inode.type) + "\n";
        text += "Access: (" + std::string(mode) + "/" + format_permissions(inode.type, inode.mode) +
                ")  Uid: " + std::to_string(inode.uid) + "  Gid: " + std::to_string(inode.gid) +
                "\n";
        text += "Access: " + format_timestamp(inode.atime) + "\n";
        text += "Modify: " + format_timestamp(inode.mtime) + "\n";
        text += "Change: " + format_timestamp(inode.ctime) + "\n";
        ctx.out(text);
    }
    return status;
}

bool parse_mode(const std::string& mode_text, std::uint32_t current, std::uint32_t& result) {
    if (mode_text.empty()) {
        return false;
    }

    if (mode_text.find_first_not_of("01234567") == std::string::npos) {
        if (mode_text.size() > 4) {
            return false;
        }
        result = static_cast<std::uint32_t>(std::stoul(mode_text, nullptr, 8));
        return true;
    }

    std::uint32_t mode = current;
    size_t start = 0;
    while (start <= mode_text.size()) {
        size_t end = mode_text.find(',', start);
        if (end == std::string::npos) {
            end = mode_text.size();
        }
        const std::string clause = mode_text.substr(start, end - start);
        size_t i = 0;
        std::uint32_t who = 0;
        for (; i < clause.size() && std::string("ugoa").find(clause[i]) != std::string::npos;
             ++i) {
            switch (clause[i]) {
                case 'u':
                    who |= 04700;
                    break;
                case 'g':
                    who |= 02070;
                    break;
                case 'o':
                    who |= 01007;
                    break;
                default:
                    who |= 07777;
                    break;
            }
        }
        if (who == 0) {
            who = 07777;
        }
        if (i >= clause.size() || std::string("+-=").find(clause[i]) == std::string::npos) {
            return false;
        }
        const char op = clause[i++];

        std::uint32_t bits = 0;
        for (; i < clause.size(); ++i) {
            switch (clause[i]) {
                case 'r':
                    bits |= 0444;
                    break;
                case 'w':
                    bits |= 0222;
                    break;
                case 'x':
                    bits |= 0111;
                    break;
                case 's':
                    bits |= 06000;
                    break;
                case 't':
                    bits |= 01000;
                    break;
                default:
                    return false;
            }
        }
        bits &= who;

        if (op == '+') {
            mode |= bits;
        } else if (op == '-') {
            mode &= ~bits;
        } else {
            mode = (mode & ~(who & 0777)) | bits;
        }
        start = end + 1;
    }
    result = mode & 07777;
    return true;
}

int chmod_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: chmod MODE PATH ...",
                             "Change file mode bits. MODE is octal (755) or symbolic (u+x)."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 3) {
        print_error({ErrorType::INVALID_ARGUMENT, "chmod", "missing operand", {}}, ctx.err);
        return 1;
    }

    int status = 0;
    for (size_t i = 2; i < args.size(); ++i) {
        const std::string path = ctx.resolve(args[i]);
        auto inode = ctx.fs.stat(path);
        if (inode.is_error()) {
            print_error("chmod", inode, ctx.err);
            status = 1;
            continue;
        }
        std::uint32_t mode = 0;
        if (!parse_mode(args[1], inode.value().mode, mode)) {
            print_error({ErrorType::INVALID_ARGUMENT, "chmod", "invalid mode: '" + args[1] + "'", {}},
                        ctx.err);
            return 1;
        }
        auto result = ctx.fs.chmod(path, mode);
        if (result.is_error()) {
            print_error("chmod", result, ctx.err);
            status = 1;
        }
    }
    return status;
}

int realpath_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args, {"Usage: realpath PATH ...", "Print the resolved absolute path."},
                            ctx)) {
        return 0;
    }
    ParsedArgs parsed;
    if (!builtin_utils::parse_flags(args, "", parsed, ctx)) {
        return 2;
    }
    if (!require_operands(parsed, 1, "realpath", ctx)) {
        return 1;
    }

    int status = 0;
    for (const auto& operand : parsed.operands) {
        auto resolved = ctx.fs.real_path(ctx.resolve(operand));
        if (resolved.is_error()) {
            print_error("realpath", resolved, ctx.err);
            status = 1;
            continue;
        }
        ctx.out(resolved.value() + "\n");
    }
    return status;
}

int basename_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: basename NAME [SUFFIX]",
                             "Print NAME with leading directories and an optional SUFFIX removed."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "basename", "missing operand", {}}, ctx.err);
        return 1;
    }

    std::string name = strip_trailing_slashes(args[1]);
    if (name != "/") {
        size_t slash = name.find_last_of('/');
        if (slash != std::string::npos) {
            name = name.substr(slash + 1);
        }
    }
    if (args.size() > 2) {
        const std::string& suffix = args[2];
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            name.erase(name.size() - suffix.size());
        }
    }
    ctx.out(name + "\n");
    return 0;
}

int dirname_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: dirname NAME", "Print NAME with its last component removed."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "dirname", "missing operand", {}}, ctx.err);
        return 1;
    }

    std::string name = strip_trailing_slashes(args[1]);
    size_t slash = name.find_last_of('/');
    if (slash == std::string::npos) {
        ctx.out(".\n");
        return 0;
    }
    name = strip_trailing_slashes(name.substr(0, slash));
    ctx.out((name.empty() ? std::string("/") : name) + "\n");
    return 0;
}
