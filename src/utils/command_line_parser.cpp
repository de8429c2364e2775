#include "utils/command_line_parser.h"

#include <getopt.h>
#include <stdlib.h>
#include <unistd.h>

#include "error_out.h"
#include "utils/usage.h"
#include "vsh.h"

namespace vsh {

CommandLineParser::ParseResult CommandLineParser::parse_arguments(int argc, char* argv[]) {
    ParseResult result;

    static struct option long_options[] = {{"command", required_argument, nullptr, 'c'},
                                           {"store", required_argument, nullptr, 's'},
                                           {"memory", no_argument, nullptr, 'm'},
                                           {"no-source", no_argument, nullptr, 'N'},
                                           {"debug", no_argument, nullptr, 'd'},
                                           {"version", no_argument, nullptr, 'v'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {nullptr, 0, nullptr, 0}};

    const char* short_options = "+c:s:mNdvh";

    int option_index = 0;
    int c;
    optind = 1;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                config::execute_command = true;
                config::cmd_to_execute = optarg;
                config::interactive_mode = false;
                break;
            case 's':
                config::store_path = optarg;
                config::persistence_enabled = true;
                break;
            case 'm':
                config::persistence_enabled = false;
                break;
            case 'N':
                config::source_enabled = false;
                break;
            case 'd':
                config::debug_enabled = true;
                setenv("VSH_DEBUG", "1", 1);
                break;
            case 'v':
                config::show_version = true;
                config::interactive_mode = false;
                break;
            case 'h':
                config::show_help = true;
                config::interactive_mode = false;
                break;
            case '?':
                print_usage();
                result.exit_code = 2;
                result.should_exit = true;
                return result;
            default:
                print_error({ErrorType::INVALID_ARGUMENT,
                             std::string(1, static_cast<char>(c)),
                             "Unrecognized option",
                             {"Check command line arguments"}});
                result.exit_code = 2;
                result.should_exit = true;
                return result;
        }
    }

    if (optind < argc) {
        result.script_file = argv[optind];
        config::interactive_mode = false;

        for (int i = optind + 1; i < argc; i++) {
            result.script_args.push_back(argv[i]);
        }
    }

    if (isatty(STDIN_FILENO) == 0) {
        config::interactive_mode = false;
    }

    return result;
}

}  // namespace vsh
