#pragma once

#include <string>

const bool PRE_RELEASE = false;
constexpr const char* c_version_base = "1.0.0";

inline std::string get_version() {
    static std::string cached_version =
        std::string(c_version_base) + (PRE_RELEASE ? " (pre-release)" : "");
    return cached_version;
}

#ifndef VSH_GIT_HASH
#define VSH_GIT_HASH "unknown"
#endif

namespace config {
extern bool interactive_mode;
extern bool execute_command;
extern std::string cmd_to_execute;
extern bool source_enabled;
extern bool persistence_enabled;
extern std::string store_path;
extern int max_nesting_depth;
extern bool debug_enabled;
extern bool show_version;
extern bool show_help;

constexpr int kDefaultMaxNestingDepth = 64;

void reset_defaults();
}  // namespace config
