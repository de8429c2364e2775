#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "vfs/inode.h"

struct CommandContext;

int ls_command(const std::vector<std::string>& args, CommandContext& ctx);

// "drwxr-xr-x" style permission string
std::string format_permissions(vfs::InodeType type, std::uint32_t mode);
std::string format_posix_time(std::int64_t mtime_ms);
