#include <unistd.h>

#include <cstdio>
#include <iostream>

#include "command_line_parser.h"
#include "config.h"
#include "error_out.h"
#include "main_loop.h"
#include "nestsh.h"

using namespace nestsh;

namespace {

int print_version() {
    std::string build_tags;
#ifdef NESTSH_ENABLE_DEBUG
    build_tags += " (debug)";
#endif
    (void)std::fprintf(stdout, "nestsh v%s%s (git %s)\n", get_version().c_str(),
                       build_tags.c_str(), NESTSH_GIT_HASH);
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    // parse passed flags
    auto parse_result = CommandLineParser::parse_arguments(argc, argv);
    if (parse_result.should_exit) {
        return parse_result.exit_code;
    }

    if (parse_result.show_version) {
        return print_version();
    }
    if (parse_result.show_help) {
        print_usage();
        return 0;
    }

    // an explicit --config must exist; the default location is optional
    auto config_result = parse_result.config_path
                             ? load_config(*parse_result.config_path)
                             : load_config_if_present(default_config_path());
    if (config_result.is_error()) {
        print_error({ErrorType::RUNTIME_ERROR,
                     "config",
                     config_result.error(),
                     {"Check the file or run without --config"}});
        return 2;
    }

    Config config = config_result.value();
    if (parse_result.max_depth) {
        config.max_nesting_depth = *parse_result.max_depth;
    }
    if (parse_result.separator) {
        config.reply_separator = *parse_result.separator;
    }

    ShellSession session(config);
    if (parse_result.command) {
        return session.process_command_line(*parse_result.command);
    }

    bool interactive = isatty(STDIN_FILENO) != 0;
    return main_process_loop(session, std::cin, interactive);
}
