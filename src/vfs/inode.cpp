#include "vfs/inode.h"

#include <chrono>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace vfs {

namespace {

constexpr const char* kBase64Alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode(const std::string& data) {
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t chunk = (static_cast<unsigned char>(data[i]) << 16) |
                              (static_cast<unsigned char>(data[i + 1]) << 8) |
                              static_cast<unsigned char>(data[i + 2]);
        out += kBase64Alphabet[(chunk >> 18) & 0x3F];
        out += kBase64Alphabet[(chunk >> 12) & 0x3F];
        out += kBase64Alphabet[(chunk >> 6) & 0x3F];
        out += kBase64Alphabet[chunk & 0x3F];
    }
    const size_t rest = data.size() - i;
    if (rest > 0) {
        std::uint32_t chunk = static_cast<unsigned char>(data[i]) << 16;
        if (rest == 2) {
            chunk |= static_cast<unsigned char>(data[i + 1]) << 8;
        }
        out += kBase64Alphabet[(chunk >> 18) & 0x3F];
        out += kBase64Alphabet[(chunk >> 12) & 0x3F];
        out += rest == 2 ? kBase64Alphabet[(chunk >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

std::string base64_decode(const std::string& text, const std::string& path) {
    std::string out;
    std::uint32_t buffer = 0;
    int bits = 0;
    size_t padding = 0;
    for (char c : text) {
        if (c == '=') {
            ++padding;
            continue;
        }
        const char* pos = padding == 0 ? std::strchr(kBase64Alphabet, c) : nullptr;
        if (pos == nullptr || c == '\0') {
            throw std::invalid_argument("invalid base64 content for " + path);
        }
        buffer = (buffer << 6) | static_cast<std::uint32_t>(pos - kBase64Alphabet);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out += static_cast<char>((buffer >> bits) & 0xFF);
        }
    }
    if (padding > 2 || (text.size() % 4) != 0) {
        throw std::invalid_argument("invalid base64 content for " + path);
    }
    return out;
}

// JSON strings must be UTF-8; anything else is stored base64-encoded
bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        const unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t extra = 0;
        std::uint32_t min_value = 0;
        std::uint32_t value = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            min_value = 0x80;
            value = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            min_value = 0x800;
            value = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            min_value = 0x10000;
            value = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (size_t k = 1; k <= extra; ++k) {
            const unsigned char next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            value = (value << 6) | (next & 0x3F);
        }
        if (value < min_value || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

}  // namespace

const char* inode_type_name(InodeType type) {
    switch (type) {
        case InodeType::Directory:
            return "dir";
        case InodeType::Symlink:
            return "symlink";
        case InodeType::File:
        default:
            return "file";
    }
}

bool parse_inode_type(const std::string& name, InodeType& out) {
    if (name == "file") {
        out = InodeType::File;
    } else if (name == "dir") {
        out = InodeType::Directory;
    } else if (name == "symlink") {
        out = InodeType::Symlink;
    } else {
        return false;
    }
    return true;
}

std::int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

Inode make_directory_inode(const std::string& path, std::uint32_t mode, std::uint32_t uid,
                           std::uint32_t gid, std::int64_t now) {
    Inode inode;
    inode.path = path;
    inode.type = InodeType::Directory;
    inode.mode = mode;
    inode.uid = uid;
    inode.gid = gid;
    inode.size = 0;
    inode.ctime = now;
    inode.mtime = now;
    inode.atime = now;
    return inode;
}

Inode make_file_inode(const std::string& path, std::string content, std::uint32_t mode,
                      std::uint32_t uid, std::uint32_t gid, std::int64_t now) {
    Inode inode;
    inode.path = path;
    inode.type = InodeType::File;
    inode.mode = mode;
    inode.uid = uid;
    inode.gid = gid;
    inode.size = content.size();
    inode.ctime = now;
    inode.mtime = now;
    inode.atime = now;
    inode.content = std::move(content);
    return inode;
}

void to_json(nlohmann::json& j, const Inode& inode) {
    j = nlohmann::json{{"path", inode.path},
                       {"type", inode_type_name(inode.type)},
                       {"mode", inode.mode},
                       {"uid", inode.uid},
                       {"gid", inode.gid},
                       {"size", inode.size},
                       {"ctime", inode.ctime},
                       {"mtime", inode.mtime},
                       {"atime", inode.atime}};
    if (!inode.content.has_value()) {
        j["content"] = nullptr;
    } else if (is_valid_utf8(*inode.content)) {
        j["content"] = *inode.content;
    } else {
        j["content"] = base64_encode(*inode.content);
        j["encoding"] = "base64";
    }
}

void from_json(const nlohmann::json& j, Inode& inode) {
    j.at("path").get_to(inode.path);

    std::string type_name = j.at("type").get<std::string>();
    if (!parse_inode_type(type_name, inode.type)) {
        throw std::invalid_argument("unknown inode type '" + type_name + "' for " + inode.path);
    }

    inode.mode = j.value("mode", inode.type == InodeType::Directory ? 0755u : 0644u);
    inode.uid = j.value("uid", 0u);
    inode.gid = j.value("gid", 0u);
    inode.ctime = j.value("ctime", static_cast<std::int64_t>(0));
    inode.mtime = j.value("mtime", inode.ctime);
    inode.atime = j.value("atime", inode.mtime);

    auto content_it = j.find("content");
    if (content_it != j.end() && content_it->is_string() &&
        inode.type != InodeType::Directory) {
        inode.content = content_it->get<std::string>();
        if (j.value("encoding", std::string()) == "base64") {
            inode.content = base64_decode(*inode.content, inode.path);
        }
    } else {
        inode.content.reset();
    }
    inode.size = inode.content.has_value() ? inode.content->size() : 0;
}

}  // namespace vfs
