#include "utils/config_loader.h"

#include <filesystem>
#include <stdexcept>
#include <system_error>

#include <nlohmann/json.hpp>

#include "session.h"
#include "utils/debug.h"
#include "vsh.h"

namespace vsh_config {

namespace {

using vsh_filesystem::ErrorKind;
using vsh_filesystem::Result;

std::map<std::string, std::string> read_string_map(const nlohmann::json& document,
                                                   const char* key) {
    std::map<std::string, std::string> values;
    if (!document.contains(key)) {
        return values;
    }
    const auto& object = document.at(key);
    if (!object.is_object()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an object");
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        if (!it.value().is_string()) {
            throw std::invalid_argument(std::string("'") + key + "." + it.key() +
                                        "' must be a string");
        }
        values[it.key()] = it.value().get<std::string>();
    }
    return values;
}

}  // namespace

Result<ConfigFile> parse_config(const std::string& text) {
    ConfigFile file;
    try {
        nlohmann::json document = nlohmann::json::parse(text);
        if (!document.is_object()) {
            return Result<ConfigFile>::error(ErrorKind::InvalidArgument,
                                             "config: top level must be an object");
        }
        if (document.contains("store_path")) {
            file.store_path = document.at("store_path").get<std::string>();
        }
        if (document.contains("persist")) {
            file.persist = document.at("persist").get<bool>();
        }
        if (document.contains("max_nesting_depth")) {
            int depth = document.at("max_nesting_depth").get<int>();
            if (depth <= 0) {
                throw std::invalid_argument("'max_nesting_depth' must be positive");
            }
            file.max_nesting_depth = depth;
        }
        file.env = read_string_map(document, "env");
        file.aliases = read_string_map(document, "aliases");
    } catch (const nlohmann::json::exception& e) {
        return Result<ConfigFile>::error(ErrorKind::InvalidArgument,
                                         std::string("config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Result<ConfigFile>::error(ErrorKind::InvalidArgument,
                                         std::string("config: ") + e.what());
    }
    return Result<ConfigFile>::ok(std::move(file));
}

Result<ConfigFile> load_config_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        debug_msg("config: %s not found, using defaults", path.c_str());
        return Result<ConfigFile>::ok(ConfigFile{});
    }

    auto content = vsh_filesystem::FileOperations::read_file_content(path);
    if (content.is_error()) {
        return vsh_filesystem::forward_error<ConfigFile>(content);
    }
    auto parsed = parse_config(content.value());
    if (parsed.is_ok()) {
        debug_msg("config: loaded %s (%zu env, %zu aliases)", path.c_str(),
                  parsed.value().env.size(), parsed.value().aliases.size());
    }
    return parsed;
}

void apply_to_globals(const ConfigFile& file) {
    if (file.store_path) {
        config::store_path = *file.store_path;
    }
    if (file.persist) {
        config::persistence_enabled = *file.persist;
    }
    if (file.max_nesting_depth) {
        config::max_nesting_depth = *file.max_nesting_depth;
    }
}

void apply_to_session(const ConfigFile& file, Session& session) {
    for (const auto& entry : file.env) {
        session.set_env(entry.first, entry.second);
    }
    for (const auto& entry : file.aliases) {
        session.aliases[entry.first] = entry.second;
    }
}

}  // namespace vsh_config
