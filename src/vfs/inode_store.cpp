#include "vfs/inode_store.h"

#include <filesystem>
#include <utility>

#include "utils/debug.h"

namespace vfs {

using vsh_filesystem::ErrorKind;
using vsh_filesystem::Result;

void apply_batch(std::map<std::string, Inode>& records, const StoreBatch& batch) {
    for (const auto& key : batch.erases) {
        records.erase(key);
    }
    for (const auto& inode : batch.puts) {
        records[inode.path] = inode;
    }
}

Result<std::vector<Inode>> MemoryInodeStore::load_all() {
    std::vector<Inode> inodes;
    inodes.reserve(records_.size());
    for (const auto& entry : records_) {
        inodes.push_back(entry.second);
    }
    return Result<std::vector<Inode>>::ok(std::move(inodes));
}

Result<void> MemoryInodeStore::commit(const StoreBatch& batch) {
    apply_batch(records_, batch);
    return Result<void>::ok();
}

std::string MemoryInodeStore::describe() const {
    return "memory";
}

JsonFileInodeStore::JsonFileInodeStore(std::string path) : path_(std::move(path)) {
}

std::string JsonFileInodeStore::describe() const {
    return "json:" + path_;
}

Result<void> JsonFileInodeStore::ensure_parent_directory() const {
    try {
        std::filesystem::path parent = std::filesystem::path(path_).parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
        }
        return Result<void>::ok();
    } catch (const std::filesystem::filesystem_error& e) {
        return Result<void>::error(ErrorKind::IoError,
                                   "Failed to create store directory: " + std::string(e.what()));
    }
}

Result<std::vector<Inode>> JsonFileInodeStore::load_all() {
    records_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        debug_msg("inode store %s does not exist yet", path_.c_str());
        return Result<std::vector<Inode>>::ok({});
    }

    auto content_result = vsh_filesystem::FileOperations::read_file_content(path_);
    if (content_result.is_error()) {
        return vsh_filesystem::forward_error<std::vector<Inode>>(content_result);
    }

    std::vector<Inode> inodes;
    try {
        nlohmann::json document = nlohmann::json::parse(content_result.value());
        int version = document.value("version", 0);
        if (version != kFormatVersion) {
            return Result<std::vector<Inode>>::error(
                ErrorKind::IoError,
                path_ + ": unsupported store version " + std::to_string(version));
        }

        const auto& items = document.at("inodes");
        inodes.reserve(items.size());
        for (const auto& item : items) {
            Inode inode = item.get<Inode>();
            records_[inode.path] = inode;
            inodes.push_back(std::move(inode));
        }
    } catch (const nlohmann::json::exception& e) {
        records_.clear();
        return Result<std::vector<Inode>>::error(ErrorKind::IoError,
                                                 path_ + ": corrupt store: " + e.what());
    } catch (const std::invalid_argument& e) {
        records_.clear();
        return Result<std::vector<Inode>>::error(ErrorKind::IoError,
                                                 path_ + ": corrupt store: " + e.what());
    }

    debug_msg("loaded %zu inodes from %s", inodes.size(), path_.c_str());
    return Result<std::vector<Inode>>::ok(std::move(inodes));
}

std::string JsonFileInodeStore::serialize(const std::map<std::string, Inode>& records) const {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& entry : records) {
        items.push_back(entry.second);
    }
    nlohmann::json document = {{"version", kFormatVersion}, {"inodes", std::move(items)}};
    return document.dump(2) + "\n";
}

Result<void> JsonFileInodeStore::commit(const StoreBatch& batch) {
    if (batch.empty()) {
        return Result<void>::ok();
    }

    auto dir_result = ensure_parent_directory();
    if (dir_result.is_error()) {
        return dir_result;
    }

    std::map<std::string, Inode> next = records_;
    apply_batch(next, batch);

    std::string text;
    try {
        text = serialize(next);
    } catch (const nlohmann::json::exception& e) {
        // paths are stored as plain JSON strings and must be valid UTF-8
        return Result<void>::error(ErrorKind::IoError,
                                   path_ + ": cannot encode store: " + e.what());
    }

    auto write_result = vsh_filesystem::FileOperations::write_file_atomic(path_, text);
    if (write_result.is_error()) {
        return Result<void>::error(ErrorKind::IoError, write_result.error());
    }

    records_ = std::move(next);
    debug_msg("committed %zu puts / %zu erases to %s", batch.puts.size(), batch.erases.size(),
              path_.c_str());
    return Result<void>::ok();
}

}  // namespace vfs
