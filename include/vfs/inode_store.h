#pragma once

#include <map>
#include <string>
#include <vector>

#include "utils/vsh_filesystem.h"
#include "vfs/inode.h"

namespace vfs {

// A set of record writes and deletions that is persisted all-or-nothing.
// Deletions are applied before writes, so a key present in both ends up written.
struct StoreBatch {
    std::vector<Inode> puts;
    std::vector<std::string> erases;

    bool empty() const {
        return puts.empty() && erases.empty();
    }
};

class InodeStore {
   public:
    virtual ~InodeStore() = default;

    virtual vsh_filesystem::Result<std::vector<Inode>> load_all() = 0;
    // must not return until the batch is durable (or has failed without partial effect)
    virtual vsh_filesystem::Result<void> commit(const StoreBatch& batch) = 0;
    virtual std::string describe() const = 0;
};

class MemoryInodeStore : public InodeStore {
   public:
    vsh_filesystem::Result<std::vector<Inode>> load_all() override;
    vsh_filesystem::Result<void> commit(const StoreBatch& batch) override;
    std::string describe() const override;

    size_t size() const {
        return records_.size();
    }

   private:
    std::map<std::string, Inode> records_;
};

// Keeps every record in one JSON document ({"version":1,"inodes":[...]}) and
// replaces the file atomically on each commit.
class JsonFileInodeStore : public InodeStore {
   public:
    static constexpr int kFormatVersion = 1;

    explicit JsonFileInodeStore(std::string path);

    vsh_filesystem::Result<std::vector<Inode>> load_all() override;
    vsh_filesystem::Result<void> commit(const StoreBatch& batch) override;
    std::string describe() const override;

    const std::string& path() const {
        return path_;
    }

   private:
    vsh_filesystem::Result<void> ensure_parent_directory() const;
    std::string serialize(const std::map<std::string, Inode>& records) const;

    std::string path_;
    std::map<std::string, Inode> records_;
};

void apply_batch(std::map<std::string, Inode>& records, const StoreBatch& batch);

}  // namespace vfs
