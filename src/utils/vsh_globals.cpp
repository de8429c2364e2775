#include "vsh.h"

#include "utils/vsh_filesystem.h"

namespace config {
bool interactive_mode = true;
bool execute_command = false;
std::string cmd_to_execute;
bool source_enabled = true;
bool persistence_enabled = true;
std::string store_path;
int max_nesting_depth = kDefaultMaxNestingDepth;
bool debug_enabled = false;
bool show_version = false;
bool show_help = false;

void reset_defaults() {
    interactive_mode = true;
    execute_command = false;
    cmd_to_execute.clear();
    source_enabled = true;
    persistence_enabled = true;
    store_path = vsh_filesystem::default_store_path().string();
    max_nesting_depth = kDefaultMaxNestingDepth;
    debug_enabled = false;
    show_version = false;
    show_help = false;
}
}  // namespace config
