#pragma once

#include <map>
#include <optional>
#include <string>

#include "utils/vsh_filesystem.h"

struct Session;

namespace vsh_config {

// Contents of ~/.config/vsh/config.json. Every key is optional.
struct ConfigFile {
    std::optional<std::string> store_path;
    std::optional<bool> persist;
    std::optional<int> max_nesting_depth;
    std::map<std::string, std::string> env;
    std::map<std::string, std::string> aliases;
};

vsh_filesystem::Result<ConfigFile> parse_config(const std::string& text);

// A missing file yields an empty ConfigFile, not an error.
vsh_filesystem::Result<ConfigFile> load_config_file(const std::string& path);

// Copies store_path, persist and max_nesting_depth into the config:: globals.
void apply_to_globals(const ConfigFile& file);

// env entries override the session defaults; aliases are added to the table.
void apply_to_session(const ConfigFile& file, Session& session);

}  // namespace vsh_config
