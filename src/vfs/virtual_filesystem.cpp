#include "vfs/virtual_filesystem.h"

#include <algorithm>
#include <regex>
#include <utility>

#include "utils/debug.h"
#include "utils/string_utils.h"

namespace vfs {

using vsh_filesystem::ErrorKind;
using vsh_filesystem::fail;
using vsh_filesystem::forward_error;
using vsh_filesystem::Result;

namespace {

constexpr const char* kNullDevice = "/dev/null";

std::vector<std::string> split_components(const std::string& canonical) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= canonical.size()) {
        size_t end = canonical.find('/', start);
        if (end == std::string::npos) {
            end = canonical.size();
        }
        if (end > start) {
            parts.push_back(canonical.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

bool is_within(const std::string& path, const std::string& ancestor) {
    if (ancestor == "/") {
        return path != "/";
    }
    return path.size() > ancestor.size() && path.compare(0, ancestor.size(), ancestor) == 0 &&
           path[ancestor.size()] == '/';
}

std::string rekey(const std::string& path, const std::string& from, const std::string& to) {
    return to + path.substr(from.size());
}

}  // namespace

std::string glob_to_regex(const std::string& pattern) {
    std::string re;
    re.reserve(pattern.size() * 2);
    for (size_t i = 0; i < pattern.size(); ++i) {
        char c = pattern[i];
        if (c == '*') {
            if (i + 1 < pattern.size() && pattern[i + 1] == '*') {
                if (i + 2 < pattern.size() && pattern[i + 2] == '/') {
                    re += "(?:.*/)?";
                    i += 2;
                } else {
                    re += ".*";
                    i += 1;
                }
            } else {
                re += "[^/]*";
            }
        } else if (c == '?') {
            re += "[^/]";
        } else if (std::string(".+^$(){}|[]\\").find(c) != std::string::npos) {
            re += '\\';
            re += c;
        } else {
            re += c;
        }
    }
    return re;
}

VirtualFilesystem::VirtualFilesystem(std::unique_ptr<InodeStore> store) : store_(std::move(store)) {
}

Result<void> VirtualFilesystem::initialize() {
    PerformanceTracker tracker("vfs initialize");

    auto loaded = store_->load_all();
    if (loaded.is_error()) {
        return forward_error<void>(loaded);
    }

    cache_.clear();
    for (auto& inode : loaded.value()) {
        std::string key = resolve_path(inode.path);
        inode.path = key;
        cache_[key] = std::move(inode);
    }

    // records whose parent is gone or not a directory cannot be reached; keys
    // sort parents first, so dropping one also drops everything below it
    for (auto it = cache_.begin(); it != cache_.end();) {
        if (it->first != "/") {
            const Inode* parent = find(parent_path(it->first));
            if (parent == nullptr || !parent->is_directory()) {
                debug_msg("vfs: dropping orphaned record %s", it->first.c_str());
                it = cache_.erase(it);
                continue;
            }
        }
        ++it;
    }

    debug_msg("vfs: loaded %zu records from %s", cache_.size(), store_->describe().c_str());

    if (find("/") == nullptr) {
        return seed_default_tree();
    }
    return Result<void>::ok();
}

Result<void> VirtualFilesystem::seed_default_tree() {
    const std::int64_t now = now_millis();
    StoreBatch batch;

    batch.puts.push_back(make_directory_inode("/", 0755, 0, 0, now));
    const char* system_dirs[] = {"/home", "/tmp",     "/bin", "/usr",     "/usr/bin",
                                 "/etc",  "/var",     "/var/log", "/dev"};
    for (const char* dir : system_dirs) {
        batch.puts.push_back(make_directory_inode(dir, 0755, 0, 0, now));
    }
    for (auto& inode : batch.puts) {
        if (inode.path == "/tmp") {
            inode.mode = 01777;
        }
    }
    batch.puts.push_back(make_directory_inode("/home/user", 0755, kDefaultUid, kDefaultGid, now));

    batch.puts.push_back(make_file_inode(kNullDevice, "", 0666, 0, 0, now));
    batch.puts.push_back(make_file_inode("/etc/hostname", "vsh\n", 0644, 0, 0, now));
    batch.puts.push_back(make_file_inode("/home/user/.vshrc", "# ~/.vshrc\n", 0644, kDefaultUid,
                                         kDefaultGid, now));

    auto result = commit(batch);
    if (result.is_ok()) {
        debug_msg("vfs: seeded default tree (%zu records)", batch.puts.size());
    }
    return result;
}

Result<void> VirtualFilesystem::commit(const StoreBatch& batch) {
    if (batch.empty()) {
        return Result<void>::ok();
    }
    auto result = store_->commit(batch);
    if (result.is_error()) {
        debug_msg("vfs: commit failed: %s", result.error().c_str());
        return result;
    }
    apply_batch(cache_, batch);
    return Result<void>::ok();
}

std::string VirtualFilesystem::resolve_path(const std::string& raw, const std::string& base,
                                            const std::string& home) {
    std::string input = raw;
    if (!home.empty()) {
        if (input == "~") {
            input = home;
        } else if (string_utils::starts_with(input, "~/")) {
            input = home + input.substr(1);
        }
    }

    std::vector<std::string> stack;
    if (input.empty() || input[0] != '/') {
        const std::string& start = base.empty() ? std::string("/") : base;
        if (start[0] == '/') {
            stack = split_components(start);
        } else {
            stack = split_components("/" + start);
        }
        // base itself may carry "." or ".."
        std::vector<std::string> normalized;
        for (const auto& part : stack) {
            if (part == ".") {
                continue;
            }
            if (part == "..") {
                if (!normalized.empty()) {
                    normalized.pop_back();
                }
                continue;
            }
            normalized.push_back(part);
        }
        stack = std::move(normalized);
    }

    for (const auto& part : split_components(input)) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!stack.empty()) {
                stack.pop_back();
            }
            continue;
        }
        stack.push_back(part);
    }

    if (stack.empty()) {
        return "/";
    }
    std::string result;
    for (const auto& part : stack) {
        result += '/';
        result += part;
    }
    return result;
}

std::string VirtualFilesystem::parent_path(const std::string& canonical) {
    size_t slash = canonical.find_last_of('/');
    if (slash == std::string::npos || slash == 0) {
        return "/";
    }
    return canonical.substr(0, slash);
}

std::string VirtualFilesystem::base_name(const std::string& canonical) {
    if (canonical == "/") {
        return "/";
    }
    size_t slash = canonical.find_last_of('/');
    if (slash == std::string::npos) {
        return canonical;
    }
    return canonical.substr(slash + 1);
}

std::string VirtualFilesystem::join_path(const std::string& dir, const std::string& name) {
    if (dir == "/") {
        return "/" + name;
    }
    return dir + "/" + name;
}

const Inode* VirtualFilesystem::find(const std::string& canonical) const {
    auto it = cache_.find(canonical);
    if (it == cache_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::vector<std::string> VirtualFilesystem::descendant_keys(const std::string& canonical) const {
    std::vector<std::string> keys;
    const std::string prefix = canonical == "/" ? "/" : canonical + "/";
    for (auto it = cache_.lower_bound(prefix); it != cache_.end(); ++it) {
        if (!string_utils::starts_with(it->first, prefix)) {
            break;
        }
        if (it->first != canonical) {
            keys.push_back(it->first);
        }
    }
    return keys;
}

bool VirtualFilesystem::has_children(const std::string& canonical) const {
    const std::string prefix = canonical == "/" ? "/" : canonical + "/";
    auto it = cache_.lower_bound(prefix);
    if (it != cache_.end() && it->first == canonical) {
        ++it;
    }
    return it != cache_.end() && string_utils::starts_with(it->first, prefix);
}

Result<std::string> VirtualFilesystem::real_path(const std::string& path) const {
    const std::string canonical = resolve_path(path);
    std::vector<std::string> pending = split_components(canonical);
    std::string current = "/";
    int hops = 0;
    size_t index = 0;

    while (index < pending.size()) {
        std::string candidate = join_path(current, pending[index]);
        const Inode* node = find(candidate);
        if (node == nullptr) {
            return fail<std::string>(ErrorKind::NotFound, canonical);
        }
        if (node->is_symlink()) {
            if (++hops > kMaxSymlinkHops) {
                return Result<std::string>::error(
                    ErrorKind::InvalidArgument,
                    canonical + ": Too many levels of symbolic links");
            }
            std::string target = resolve_path(node->content.value_or(""), current);
            std::vector<std::string> rest(pending.begin() + static_cast<long>(index) + 1,
                                          pending.end());
            pending = split_components(target);
            pending.insert(pending.end(), rest.begin(), rest.end());
            current = "/";
            index = 0;
            continue;
        }
        if (!node->is_directory() && index + 1 < pending.size()) {
            return fail<std::string>(ErrorKind::NotADirectory, canonical);
        }
        current = candidate;
        ++index;
    }
    return Result<std::string>::ok(current);
}

// Resolves every component but the last, so the final name can be a new
// entry or a symlink that is acted on rather than followed.
Result<std::string> VirtualFilesystem::resolve_parent_links(const std::string& path) const {
    const std::string canonical = resolve_path(path);
    if (canonical == "/") {
        return Result<std::string>::ok(canonical);
    }
    auto parent = real_path(parent_path(canonical));
    if (parent.is_error()) {
        if (parent.kind() == ErrorKind::NotFound) {
            return fail<std::string>(ErrorKind::NotFound, canonical);
        }
        return parent;
    }
    return Result<std::string>::ok(join_path(parent.value(), base_name(canonical)));
}

Result<void> VirtualFilesystem::require_parent_directory(const std::string& canonical) const {
    const Inode* parent = find(parent_path(canonical));
    if (parent == nullptr) {
        return fail(ErrorKind::NotFound, canonical);
    }
    if (!parent->is_directory()) {
        return fail(ErrorKind::NotADirectory, canonical);
    }
    return Result<void>::ok();
}

Result<Inode> VirtualFilesystem::stat(const std::string& path) const {
    auto resolved = real_path(path);
    if (resolved.is_error()) {
        return forward_error<Inode>(resolved);
    }
    return Result<Inode>::ok(*find(resolved.value()));
}

Result<Inode> VirtualFilesystem::lstat(const std::string& path) const {
    auto resolved = resolve_parent_links(path);
    if (resolved.is_error()) {
        return forward_error<Inode>(resolved);
    }
    const Inode* node = find(resolved.value());
    if (node == nullptr) {
        return fail<Inode>(ErrorKind::NotFound, resolve_path(path));
    }
    return Result<Inode>::ok(*node);
}

bool VirtualFilesystem::exists(const std::string& path) const {
    return lstat(path).is_ok();
}

Result<std::string> VirtualFilesystem::read_file(const std::string& path) {
    auto resolved = real_path(path);
    if (resolved.is_error()) {
        return forward_error<std::string>(resolved);
    }
    auto it = cache_.find(resolved.value());
    if (it->second.is_directory()) {
        return fail<std::string>(ErrorKind::IsADirectory, resolve_path(path));
    }
    // access time is tracked in memory only; persisting it would turn every read into a write
    it->second.atime = now_millis();
    return Result<std::string>::ok(it->second.content.value_or(""));
}

Result<void> VirtualFilesystem::write_file(const std::string& path, const std::string& content,
                                           const WriteOptions& options) {
    auto resolved = resolve_parent_links(path);
    if (resolved.is_error()) {
        return forward_error<void>(resolved);
    }
    std::string target = resolved.value();

    const Inode* link = find(target);
    if (link != nullptr && link->is_symlink()) {
        auto followed = real_path(target);
        if (followed.is_ok()) {
            target = followed.value();
        } else if (followed.kind() == ErrorKind::NotFound) {
            target = resolve_path(link->content.value_or(""), parent_path(target));
        } else {
            return forward_error<void>(followed);
        }
    }

    if (target == kNullDevice) {
        return Result<void>::ok();
    }

    auto parent_check = require_parent_directory(target);
    if (parent_check.is_error()) {
        return parent_check;
    }

    const std::int64_t now = now_millis();
    const Inode* existing = find(target);
    Inode node;
    if (existing != nullptr) {
        if (existing->is_directory()) {
            return fail(ErrorKind::IsADirectory, target);
        }
        node = *existing;
        std::string data = options.append ? existing->content.value_or("") + content : content;
        node.size = data.size();
        node.content = std::move(data);
        node.mtime = now;
        node.atime = now;
    } else {
        node = make_file_inode(target, content, 0644, options.uid, options.gid, now);
    }

    StoreBatch batch;
    batch.puts.push_back(std::move(node));
    return commit(batch);
}

Result<void> VirtualFilesystem::mkdir(const std::string& path, bool recursive, std::uint32_t uid,
                                      std::uint32_t gid) {
    const std::string canonical = resolve_path(path);
    const std::int64_t now = now_millis();

    if (!recursive) {
        auto resolved = resolve_parent_links(canonical);
        if (resolved.is_error()) {
            return forward_error<void>(resolved);
        }
        if (find(resolved.value()) != nullptr) {
            return fail(ErrorKind::AlreadyExists, canonical);
        }
        auto parent_check = require_parent_directory(resolved.value());
        if (parent_check.is_error()) {
            return parent_check;
        }
        StoreBatch batch;
        batch.puts.push_back(make_directory_inode(resolved.value(), 0755, uid, gid, now));
        return commit(batch);
    }

    StoreBatch batch;
    std::string current = "/";
    const auto parts = split_components(canonical);
    bool creating = false;
    for (size_t i = 0; i < parts.size(); ++i) {
        std::string candidate = join_path(current, parts[i]);
        const Inode* node = creating ? nullptr : find(candidate);
        if (node == nullptr) {
            creating = true;
            batch.puts.push_back(make_directory_inode(candidate, 0755, uid, gid, now));
            current = candidate;
            continue;
        }
        if (node->is_symlink()) {
            auto followed = real_path(candidate);
            if (followed.is_error()) {
                return forward_error<void>(followed);
            }
            if (!find(followed.value())->is_directory()) {
                return fail(i + 1 == parts.size() ? ErrorKind::AlreadyExists
                                                  : ErrorKind::NotADirectory,
                            canonical);
            }
            current = followed.value();
            continue;
        }
        if (!node->is_directory()) {
            return fail(i + 1 == parts.size() ? ErrorKind::AlreadyExists
                                              : ErrorKind::NotADirectory,
                        canonical);
        }
        current = candidate;
    }
    return commit(batch);
}

Result<std::vector<DirEntry>> VirtualFilesystem::readdir(const std::string& path) const {
    auto resolved = real_path(path);
    if (resolved.is_error()) {
        return forward_error<std::vector<DirEntry>>(resolved);
    }
    const std::string dir = resolved.value();
    if (!find(dir)->is_directory()) {
        return fail<std::vector<DirEntry>>(ErrorKind::NotADirectory, resolve_path(path));
    }

    std::vector<DirEntry> entries;
    const std::string prefix = dir == "/" ? "/" : dir + "/";
    for (auto it = cache_.lower_bound(prefix); it != cache_.end(); ++it) {
        if (!string_utils::starts_with(it->first, prefix)) {
            break;
        }
        if (it->first == dir) {
            continue;
        }
        std::string rest = it->first.substr(prefix.size());
        if (rest.empty() || rest.find('/') != std::string::npos) {
            continue;
        }
        DirEntry entry;
        entry.name = rest;
        entry.type = it->second.type;
        entry.mode = it->second.mode;
        entry.size = it->second.size;
        entry.mtime = it->second.mtime;
        entries.push_back(std::move(entry));
    }
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.name < b.name; });
    return Result<std::vector<DirEntry>>::ok(std::move(entries));
}

Result<void> VirtualFilesystem::unlink(const std::string& path) {
    auto node = lstat(path);
    if (node.is_error()) {
        return forward_error<void>(node);
    }
    if (node.value().is_directory()) {
        return fail(ErrorKind::IsADirectory, resolve_path(path));
    }
    if (node.value().path == kNullDevice) {
        return Result<void>::error(ErrorKind::InvalidArgument,
                                   std::string(kNullDevice) + ": Operation not permitted");
    }
    StoreBatch batch;
    batch.erases.push_back(node.value().path);
    return commit(batch);
}

Result<void> VirtualFilesystem::rmdir(const std::string& path, bool recursive) {
    auto node = lstat(path);
    if (node.is_error()) {
        return forward_error<void>(node);
    }
    const std::string target = node.value().path;
    if (target == "/") {
        return Result<void>::error(ErrorKind::InvalidArgument, "/: Cannot remove root directory");
    }
    if (!node.value().is_directory()) {
        return fail(ErrorKind::NotADirectory, resolve_path(path));
    }

    StoreBatch batch;
    if (has_children(target)) {
        if (!recursive) {
            return fail(ErrorKind::NotEmpty, resolve_path(path));
        }
        // deepest first, so a store applying the erases in order never sees an orphan
        auto keys = descendant_keys(target);
        std::sort(keys.begin(), keys.end(), [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });
        batch.erases = std::move(keys);
    }
    batch.erases.push_back(target);
    return commit(batch);
}

Result<void> VirtualFilesystem::rename(const std::string& old_path, const std::string& new_path) {
    auto source = lstat(old_path);
    if (source.is_error()) {
        return forward_error<void>(source);
    }
    const std::string from = source.value().path;
    if (from == "/") {
        return Result<void>::error(ErrorKind::InvalidArgument, "/: Cannot move root directory");
    }

    auto dest_resolved = resolve_parent_links(new_path);
    if (dest_resolved.is_error()) {
        return forward_error<void>(dest_resolved);
    }
    const std::string to = dest_resolved.value();
    if (to == from) {
        return Result<void>::ok();
    }
    if (is_within(to, from)) {
        return Result<void>::error(ErrorKind::InvalidArgument,
                                   from + ": Cannot move a directory into itself");
    }
    auto parent_check = require_parent_directory(to);
    if (parent_check.is_error()) {
        return parent_check;
    }

    StoreBatch batch;
    const Inode* existing = find(to);
    if (existing != nullptr) {
        if (existing->is_directory()) {
            if (!source.value().is_directory()) {
                return fail(ErrorKind::IsADirectory, to);
            }
            if (has_children(to)) {
                return fail(ErrorKind::NotEmpty, to);
            }
        } else if (source.value().is_directory()) {
            return fail(ErrorKind::NotADirectory, to);
        }
        batch.erases.push_back(to);
    }

    const std::int64_t now = now_millis();
    Inode moved = source.value();
    moved.path = to;
    moved.mtime = now;
    batch.erases.push_back(from);
    batch.puts.push_back(std::move(moved));

    for (const auto& key : descendant_keys(from)) {
        Inode child = cache_.at(key);
        child.path = rekey(key, from, to);
        batch.erases.push_back(key);
        batch.puts.push_back(std::move(child));
    }
    debug_msg("vfs: rename %s -> %s (%zu records)", from.c_str(), to.c_str(), batch.puts.size());
    return commit(batch);
}

Result<void> VirtualFilesystem::copy(const std::string& src, const std::string& dest,
                                     bool recursive) {
    auto source_path = real_path(src);
    if (source_path.is_error()) {
        return forward_error<void>(source_path);
    }
    const std::string from = source_path.value();
    const Inode source = *find(from);
    if (source.is_directory() && !recursive) {
        return Result<void>::error(ErrorKind::IsADirectory,
                                   resolve_path(src) + ": -r not specified; omitting directory");
    }

    auto dest_resolved = resolve_parent_links(dest);
    if (dest_resolved.is_error()) {
        return forward_error<void>(dest_resolved);
    }
    std::string to = dest_resolved.value();
    auto dest_followed = real_path(to);
    if (dest_followed.is_ok() && find(dest_followed.value())->is_directory()) {
        to = join_path(dest_followed.value(), base_name(from));
    }

    if (to == from) {
        return Result<void>::error(ErrorKind::InvalidArgument,
                                   "'" + from + "' and '" + to + "' are the same file");
    }
    if (is_within(to, from)) {
        return Result<void>::error(ErrorKind::InvalidArgument,
                                   resolve_path(src) + ": Cannot copy a directory into itself");
    }
    auto parent_check = require_parent_directory(to);
    if (parent_check.is_error()) {
        return parent_check;
    }

    const Inode* existing = find(to);
    if (existing != nullptr) {
        if (existing->is_directory() && !source.is_directory()) {
            return fail(ErrorKind::IsADirectory, to);
        }
        if (!existing->is_directory() && source.is_directory()) {
            return fail(ErrorKind::NotADirectory, to);
        }
    }

    const std::int64_t now = now_millis();
    auto fresh = [now](Inode inode, const std::string& path) {
        inode.path = path;
        inode.ctime = now;
        inode.mtime = now;
        inode.atime = now;
        return inode;
    };

    StoreBatch batch;
    if (!(existing != nullptr && existing->is_directory())) {
        batch.puts.push_back(fresh(source, to));
    }
    if (source.is_directory()) {
        for (const auto& key : descendant_keys(from)) {
            batch.puts.push_back(fresh(cache_.at(key), rekey(key, from, to)));
        }
    }
    return commit(batch);
}

Result<void> VirtualFilesystem::symlink(const std::string& target, const std::string& link_path,
                                        std::uint32_t uid, std::uint32_t gid) {
    auto resolved = resolve_parent_links(link_path);
    if (resolved.is_error()) {
        return forward_error<void>(resolved);
    }
    const std::string link = resolved.value();
    if (find(link) != nullptr) {
        return fail(ErrorKind::AlreadyExists, resolve_path(link_path));
    }
    auto parent_check = require_parent_directory(link);
    if (parent_check.is_error()) {
        return parent_check;
    }

    Inode node = make_file_inode(link, target, 0777, uid, gid, now_millis());
    node.type = InodeType::Symlink;
    StoreBatch batch;
    batch.puts.push_back(std::move(node));
    return commit(batch);
}

Result<std::string> VirtualFilesystem::readlink(const std::string& path) const {
    auto node = lstat(path);
    if (node.is_error()) {
        return forward_error<std::string>(node);
    }
    if (!node.value().is_symlink()) {
        return fail<std::string>(ErrorKind::InvalidArgument, resolve_path(path));
    }
    return Result<std::string>::ok(node.value().content.value_or(""));
}

Result<void> VirtualFilesystem::chmod(const std::string& path, std::uint32_t mode) {
    auto node = stat(path);
    if (node.is_error()) {
        return forward_error<void>(node);
    }
    Inode updated = node.value();
    updated.mode = mode & 07777;
    updated.ctime = now_millis();
    StoreBatch batch;
    batch.puts.push_back(std::move(updated));
    return commit(batch);
}

Result<void> VirtualFilesystem::touch(const std::string& path, std::uint32_t uid,
                                      std::uint32_t gid) {
    auto node = stat(path);
    if (node.is_error()) {
        if (node.kind() != ErrorKind::NotFound) {
            return forward_error<void>(node);
        }
        WriteOptions options;
        options.append = true;
        options.uid = uid;
        options.gid = gid;
        return write_file(path, "", options);
    }
    Inode updated = node.value();
    const std::int64_t now = now_millis();
    updated.mtime = now;
    updated.atime = now;
    StoreBatch batch;
    batch.puts.push_back(std::move(updated));
    return commit(batch);
}

Result<std::vector<std::string>> VirtualFilesystem::glob(const std::string& pattern,
                                                         const std::string& base) const {
    std::regex matcher;
    try {
        matcher = std::regex(glob_to_regex(pattern));
    } catch (const std::regex_error& e) {
        return Result<std::vector<std::string>>::error(ErrorKind::InvalidArgument,
                                                       pattern + ": " + e.what());
    }

    const bool absolute = !pattern.empty() && pattern[0] == '/';
    const std::string root = absolute ? "/" : resolve_path(base);
    const std::string prefix = root == "/" ? "/" : root + "/";

    std::vector<std::string> matches;
    for (auto it = cache_.lower_bound(prefix); it != cache_.end(); ++it) {
        if (!string_utils::starts_with(it->first, prefix)) {
            break;
        }
        const std::string candidate = absolute ? it->first : it->first.substr(prefix.size());
        if (candidate.empty()) {
            continue;
        }
        if (std::regex_match(candidate, matcher)) {
            matches.push_back(candidate);
        }
    }
    std::sort(matches.begin(), matches.end());
    return Result<std::vector<std::string>>::ok(std::move(matches));
}

}  // namespace vfs
