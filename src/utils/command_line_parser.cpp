#include "command_line_parser.h"

#include <getopt.h>

#include <cerrno>
#include <cstdlib>
#include <iostream>

#include "error_out.h"
#include "nestsh.h"
#include "tokenizer.h"

namespace nestsh {

void print_usage() {
    std::cout << "Usage: nestsh [options] [TEXT...]\n"
              << "nestsh version " << get_version() << "\n\n"
              << "Runs each line after replacing $(COMMAND) with the replies of COMMAND.\n\n"
              << "Options:\n"
              << "  -c, --command=TEXT         Run TEXT and exit\n"
              << "  -f, --config=PATH          Load configuration from PATH\n"
              << "  -d, --max-depth=N          Reject interpolations nested deeper than N "
                 "(0 = unlimited)\n"
              << "  -s, --separator=STR        Join multiple replies with STR\n"
              << "  -v, --version              Print version information and exit\n"
              << "  -h, --help                 Display this help message and exit\n\n"
              << "Without TEXT or -c, lines are read from standard input.\n"
              << "Set NESTSH_DEBUG=1 for debug output." << std::endl;
}

bool CommandLineParser::parse_depth(const char* text, size_t& out) {
    if (text == nullptr || *text == '\0' || *text == '-') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text, &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<size_t>(value);
    return true;
}

CommandLineParser::ParseResult CommandLineParser::parse_arguments(int argc, char* argv[]) {
    ParseResult result;

    static struct option long_options[] = {{"command", required_argument, nullptr, 'c'},
                                           {"config", required_argument, nullptr, 'f'},
                                           {"max-depth", required_argument, nullptr, 'd'},
                                           {"separator", required_argument, nullptr, 's'},
                                           {"version", no_argument, nullptr, 'v'},
                                           {"help", no_argument, nullptr, 'h'},
                                           {nullptr, 0, nullptr, 0}};

    const char* short_options = "+c:f:d:s:vh";

    int option_index = 0;
    int c;
    optind = 1;

    while ((c = getopt_long(argc, argv, short_options, long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                result.command = optarg;
                break;
            case 'f':
                result.config_path = optarg;
                break;
            case 'd': {
                size_t depth = 0;
                if (!parse_depth(optarg, depth)) {
                    print_error({ErrorType::INVALID_ARGUMENT,
                                 "--max-depth",
                                 std::string("not a non-negative integer: ") + optarg,
                                 {}});
                    result.exit_code = 2;
                    result.should_exit = true;
                    return result;
                }
                result.max_depth = depth;
                break;
            }
            case 's':
                result.separator = optarg;
                break;
            case 'v':
                result.show_version = true;
                break;
            case 'h':
                result.show_help = true;
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
        if (result.command) {
            print_error({ErrorType::INVALID_ARGUMENT,
                         "-c",
                         "cannot be combined with positional TEXT",
                         {"Pass the whole line to -c"}});
            result.exit_code = 2;
            result.should_exit = true;
            return result;
        }
        std::vector<std::string> words(argv + optind, argv + argc);
        result.command = Tokenizer::join_arguments(words, 0);
    }

    return result;
}

}  // namespace nestsh
