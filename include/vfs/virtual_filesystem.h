#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "utils/vsh_filesystem.h"
#include "vfs/inode.h"
#include "vfs/inode_store.h"

namespace vfs {

struct DirEntry {
    std::string name;
    InodeType type = InodeType::File;
    std::uint32_t mode = 0;
    std::uint64_t size = 0;
    std::int64_t mtime = 0;
};

struct WriteOptions {
    bool append = false;
    std::uint32_t uid = 1000;
    std::uint32_t gid = 1000;
};

constexpr std::uint32_t kDefaultUid = 1000;
constexpr std::uint32_t kDefaultGid = 1000;
constexpr int kMaxSymlinkHops = 16;

// Path-keyed store of file/directory/symlink records.
//
// Every path argument is canonicalized against "/" before use, so callers
// normally resolve user input against a session first (Session::resolve_path).
// Mutations are write-through: the batch is committed to the backing store
// first and only applied to the in-memory cache once the store confirms it.
class VirtualFilesystem {
   public:
    explicit VirtualFilesystem(std::unique_ptr<InodeStore> store);

    VirtualFilesystem(const VirtualFilesystem&) = delete;
    VirtualFilesystem& operator=(const VirtualFilesystem&) = delete;

    // loads the store and seeds the default tree when "/" is missing
    vsh_filesystem::Result<void> initialize();

    static std::string resolve_path(const std::string& raw, const std::string& base = "/",
                                    const std::string& home = "");
    static std::string parent_path(const std::string& canonical);
    static std::string base_name(const std::string& canonical);
    static std::string join_path(const std::string& dir, const std::string& name);

    vsh_filesystem::Result<Inode> stat(const std::string& path) const;
    vsh_filesystem::Result<Inode> lstat(const std::string& path) const;
    bool exists(const std::string& path) const;

    vsh_filesystem::Result<std::string> read_file(const std::string& path);
    vsh_filesystem::Result<void> write_file(const std::string& path, const std::string& content,
                                            const WriteOptions& options = WriteOptions());
    vsh_filesystem::Result<void> mkdir(const std::string& path, bool recursive = false,
                                       std::uint32_t uid = kDefaultUid,
                                       std::uint32_t gid = kDefaultGid);
    vsh_filesystem::Result<std::vector<DirEntry>> readdir(const std::string& path) const;
    vsh_filesystem::Result<void> unlink(const std::string& path);
    vsh_filesystem::Result<void> rmdir(const std::string& path, bool recursive = false);
    vsh_filesystem::Result<void> rename(const std::string& old_path, const std::string& new_path);
    vsh_filesystem::Result<void> copy(const std::string& src, const std::string& dest,
                                      bool recursive = false);
    vsh_filesystem::Result<void> symlink(const std::string& target, const std::string& link_path,
                                         std::uint32_t uid = kDefaultUid,
                                         std::uint32_t gid = kDefaultGid);
    vsh_filesystem::Result<std::string> readlink(const std::string& path) const;
    vsh_filesystem::Result<void> chmod(const std::string& path, std::uint32_t mode);
    vsh_filesystem::Result<void> touch(const std::string& path, std::uint32_t uid = kDefaultUid,
                                       std::uint32_t gid = kDefaultGid);

    // Matches pattern against paths below base; '*' and '?' stay within one
    // segment, '**' spans segments. Results are relative to base (absolute when
    // the pattern is) and sorted.
    vsh_filesystem::Result<std::vector<std::string>> glob(const std::string& pattern,
                                                          const std::string& base) const;

    // canonical path with every symlink component replaced by its target
    vsh_filesystem::Result<std::string> real_path(const std::string& path) const;

    size_t inode_count() const {
        return cache_.size();
    }

    const InodeStore& store() const {
        return *store_;
    }

   private:
    vsh_filesystem::Result<void> commit(const StoreBatch& batch);
    vsh_filesystem::Result<void> seed_default_tree();
    vsh_filesystem::Result<std::string> resolve_parent_links(const std::string& path) const;
    vsh_filesystem::Result<void> require_parent_directory(const std::string& canonical) const;

    const Inode* find(const std::string& canonical) const;
    std::vector<std::string> descendant_keys(const std::string& canonical) const;
    bool has_children(const std::string& canonical) const;

    std::unique_ptr<InodeStore> store_;
    std::map<std::string, Inode> cache_;
};

std::string glob_to_regex(const std::string& pattern);

}  // namespace vfs
