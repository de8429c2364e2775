#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace vfs {

enum class InodeType : std::uint8_t {
    File,
    Directory,
    Symlink
};

const char* inode_type_name(InodeType type);
bool parse_inode_type(const std::string& name, InodeType& out);

// One record of the filesystem, keyed by its canonical absolute path.
// Directories carry no content; symlinks keep their target string in content.
struct Inode {
    std::string path;
    InodeType type = InodeType::File;
    std::uint32_t mode = 0644;
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    std::uint64_t size = 0;
    std::int64_t ctime = 0;
    std::int64_t mtime = 0;
    std::int64_t atime = 0;
    std::optional<std::string> content;

    bool is_file() const {
        return type == InodeType::File;
    }
    bool is_directory() const {
        return type == InodeType::Directory;
    }
    bool is_symlink() const {
        return type == InodeType::Symlink;
    }
};

// milliseconds since the unix epoch
std::int64_t now_millis();

Inode make_directory_inode(const std::string& path, std::uint32_t mode, std::uint32_t uid,
                           std::uint32_t gid, std::int64_t now);
Inode make_file_inode(const std::string& path, std::string content, std::uint32_t mode,
                      std::uint32_t uid, std::uint32_t gid, std::int64_t now);

void to_json(nlohmann::json& j, const Inode& inode);
void from_json(const nlohmann::json& j, Inode& inode);

}  // namespace vfs
