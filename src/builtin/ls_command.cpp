#include "builtin/ls_command.h"

#include <ctime>

#include "builtin/builtin_help.h"
#include "command_context.h"
#include "error_out.h"
#include "vfs/virtual_filesystem.h"

std::string format_permissions(vfs::InodeType type, std::uint32_t mode) {
    char perms[11];
    if (type == vfs::InodeType::Directory)
        perms[0] = 'd';
    else if (type == vfs::InodeType::Symlink)
        perms[0] = 'l';
    else
        perms[0] = '-';

    perms[1] = (mode & 0400) ? 'r' : '-';
    perms[2] = (mode & 0200) ? 'w' : '-';
    if (mode & 04000) {
        perms[3] = (mode & 0100) ? 's' : 'S';
    } else {
        perms[3] = (mode & 0100) ? 'x' : '-';
    }

    perms[4] = (mode & 040) ? 'r' : '-';
    perms[5] = (mode & 020) ? 'w' : '-';
    if (mode & 02000) {
        perms[6] = (mode & 010) ? 's' : 'S';
    } else {
        perms[6] = (mode & 010) ? 'x' : '-';
    }

    perms[7] = (mode & 04) ? 'r' : '-';
    perms[8] = (mode & 02) ? 'w' : '-';
    if (mode & 01000) {
        perms[9] = (mode & 01) ? 't' : 'T';
    } else {
        perms[9] = (mode & 01) ? 'x' : '-';
    }

    perms[10] = '\0';
    return std::string(perms);
}

std::string format_posix_time(std::int64_t mtime_ms) {
    time_t mtime = static_cast<time_t>(mtime_ms / 1000);
    time_t now = time(nullptr);
    struct tm tm_info {};
    localtime_r(&mtime, &tm_info);
    char buffer[32];

    if (now - mtime > 6 * 30 * 24 * 60 * 60 || mtime > now) {
        strftime(buffer, sizeof(buffer), "%b %e  %Y", &tm_info);
    } else {
        strftime(buffer, sizeof(buffer), "%b %e %H:%M", &tm_info);
    }

    return std::string(buffer);
}

namespace {

struct ListingOptions {
    bool show_hidden = false;
    bool long_format = false;
};

std::string format_long_entry(const std::string& name, const vfs::Inode& inode) {
    std::string size = std::to_string(inode.size);
    if (size.size() < 8) {
        size.insert(0, 8 - size.size(), ' ');
    }
    std::string line = format_permissions(inode.type, inode.mode) + " " +
                       std::to_string(inode.uid) + " " + std::to_string(inode.gid) + " " + size +
                       " " + format_posix_time(inode.mtime) + " " + name;
    if (inode.is_symlink()) {
        line += " -> " + inode.content.value_or("");
    }
    return line;
}

int list_directory(const std::string& path, const ListingOptions& options, CommandContext& ctx) {
    auto entries = ctx.fs.readdir(path);
    if (entries.is_error()) {
        print_error("ls", entries, ctx.err);
        return 1;
    }

    std::vector<std::string> names;
    std::string output;
    if (options.show_hidden) {
        names.push_back(".");
        names.push_back("..");
    }
    for (const auto& entry : entries.value()) {
        if (!options.show_hidden && !entry.name.empty() && entry.name[0] == '.') {
            continue;
        }
        names.push_back(entry.name);
    }

    for (const auto& name : names) {
        if (options.long_format) {
            std::string child = vfs::VirtualFilesystem::resolve_path(name, path);
            auto inode = ctx.fs.lstat(child);
            if (inode.is_ok()) {
                output += format_long_entry(name, inode.value()) + "\n";
            }
        } else {
            output += name + "\n";
        }
    }
    ctx.out(output);
    return 0;
}

}  // namespace

int ls_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: ls [-a] [-l] [-1] [PATH ...]",
                             "List directory contents, sorted by name.",
                             "-a includes entries starting with '.', -l uses the long format."},
                            ctx)) {
        return 0;
    }

    ListingOptions options;
    std::vector<std::string> paths;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.size() > 1 && arg[0] == '-') {
            for (size_t j = 1; j < arg.size(); ++j) {
                switch (arg[j]) {
                    case 'a':
                    case 'A':
                        options.show_hidden = true;
                        break;
                    case 'l':
                        options.long_format = true;
                        break;
                    case '1':
                        // output is always one entry per line
                        break;
                    default:
                        print_error({ErrorType::INVALID_ARGUMENT,
                                     "ls",
                                     std::string("invalid option -- '") + arg[j] + "'",
                                     {"Usage: ls [-a] [-l] [-1] [PATH ...]"}},
                                    ctx.err);
                        return 2;
                }
            }
        } else {
            paths.push_back(arg);
        }
    }
    if (paths.empty()) {
        paths.push_back(".");
    }

    int status = 0;
    for (size_t i = 0; i < paths.size(); ++i) {
        const std::string resolved = ctx.resolve(paths[i]);
        auto inode = ctx.fs.stat(resolved);
        if (inode.is_error()) {
            print_error("ls", inode, ctx.err);
            status = 1;
            continue;
        }
        if (!inode.value().is_directory()) {
            ctx.out(options.long_format ? format_long_entry(paths[i], inode.value()) + "\n"
                                        : paths[i] + "\n");
            continue;
        }
        if (paths.size() > 1) {
            ctx.out((i > 0 ? "\n" : "") + paths[i] + ":\n");
        }
        if (list_directory(resolved, options, ctx) != 0) {
            status = 1;
        }
    }
    return status;
}
