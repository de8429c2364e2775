#include "builtin/find_command.h"

#include <optional>
#include <regex>

#include "builtin/builtin_help.h"
#include "command_context.h"
#include "error_out.h"
#include "vfs/virtual_filesystem.h"

using vfs::InodeType;
using vfs::VirtualFilesystem;

namespace {

struct FindFilter {
    std::optional<std::regex> name;
    std::optional<InodeType> type;
};

bool matches(const FindFilter& filter, const std::string& name, InodeType type) {
    if (filter.type && *filter.type != type) {
        return false;
    }
    if (filter.name && !std::regex_match(name, *filter.name)) {
        return false;
    }
    return true;
}

// depth-first, children in name order; symlinked directories are not descended
void walk(CommandContext& ctx, const std::string& path, const std::string& display,
          const FindFilter& filter, std::string& output) {
    auto entries = ctx.fs.readdir(path);
    if (entries.is_error()) {
        return;
    }
    for (const auto& entry : entries.value()) {
        std::string child_path = VirtualFilesystem::join_path(path, entry.name);
        std::string child_display =
            display.empty() || display.back() == '/' ? display + entry.name
                                                     : display + "/" + entry.name;
        if (matches(filter, entry.name, entry.type)) {
            output += child_display + "\n";
        }
        if (entry.type == InodeType::Directory) {
            walk(ctx, child_path, child_display, filter, output);
        }
    }
}

}  // namespace

int find_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: find [PATH ...] [-name PATTERN] [-type f|d|l]",
                             "Recursively list paths below each PATH (default '.').",
                             "PATTERN is matched against the last path component."},
                            ctx)) {
        return 0;
    }

    std::vector<std::string> roots;
    FindFilter filter;
    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-name" || arg == "-type") {
            if (i + 1 >= args.size()) {
                print_error({ErrorType::INVALID_ARGUMENT, "find", "missing argument to '" + arg + "'", {}},
                            ctx.err);
                return 1;
            }
            const std::string& value = args[++i];
            if (arg == "-name") {
                try {
                    filter.name = std::regex(vfs::glob_to_regex(value));
                } catch (const std::regex_error& e) {
                    print_error({ErrorType::INVALID_ARGUMENT, "find", e.what(), {}}, ctx.err);
                    return 1;
                }
            } else if (value == "f") {
                filter.type = InodeType::File;
            } else if (value == "d") {
                filter.type = InodeType::Directory;
            } else if (value == "l") {
                filter.type = InodeType::Symlink;
            } else {
                print_error({ErrorType::INVALID_ARGUMENT, "find", "Unknown argument to -type: " + value, {}},
                            ctx.err);
                return 1;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            print_error({ErrorType::INVALID_ARGUMENT, "find", "unknown predicate '" + arg + "'", {}},
                        ctx.err);
            return 1;
        } else {
            roots.push_back(arg);
        }
    }
    if (roots.empty()) {
        roots.push_back(".");
    }

    int status = 0;
    std::string output;
    for (const auto& root : roots) {
        const std::string path = ctx.resolve(root);
        auto inode = ctx.fs.lstat(path);
        if (inode.is_error()) {
            print_error("find", inode, ctx.err);
            status = 1;
            continue;
        }
        if (matches(filter, VirtualFilesystem::base_name(path), inode.value().type)) {
            output += root + "\n";
        }
        if (inode.value().is_directory()) {
            walk(ctx, path, root, filter, output);
        }
    }
    ctx.out(output);
    return status;
}

int glob_command(const std::vector<std::string>& args, CommandContext& ctx) {
    if (builtin_handle_help(args,
                            {"Usage: glob PATTERN [BASE]",
                             "Print paths below BASE (default '.') matching PATTERN.",
                             "'*' and '?' match within one path segment, '**' across segments."},
                            ctx)) {
        return 0;
    }
    if (args.size() < 2) {
        print_error({ErrorType::INVALID_ARGUMENT, "glob", "missing pattern", {"Usage: glob PATTERN [BASE]"}},
                    ctx.err);
        return 1;
    }

    const std::string base = ctx.resolve(args.size() > 2 ? args[2] : ".");
    auto result = ctx.fs.glob(args[1], base);
    if (result.is_error()) {
        print_error("glob", result, ctx.err);
        return 1;
    }
    std::string output;
    for (const auto& match : result.value()) {
        output += match + "\n";
    }
    ctx.out(output);
    return 0;
}
