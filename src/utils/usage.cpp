#include "utils/usage.h"

#include <iostream>

#include "vsh.h"

void print_usage() {
    std::cout << "Usage: vsh [options] [SCRIPT [ARGS ...]]\n"
              << "vsh, a virtual shell, version " << get_version() << "\n\n"
              << "Options:\n"
              << "  -c, --command=COMMAND      Execute the specified command and exit\n"
              << "  -s, --store=PATH           Persist the virtual filesystem to PATH\n"
              << "  -m, --memory               Keep the virtual filesystem in memory only\n"
              << "  -N, --no-source            Don't source ~/.vshrc\n"
              << "  -d, --debug                Enable debug output\n"
              << "  -v, --version              Print version information and exit\n"
              << "  -h, --help                 Display this help message and exit\n\n"
              << "Configuration is read from ~/.config/vsh/config.json\n"
              << "Run 'help' inside vsh for the list of commands." << std::endl;
}
