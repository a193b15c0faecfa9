#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace nestsh {

class CommandLineParser {
   public:
    struct ParseResult {
        std::optional<std::string> command;
        std::optional<std::string> config_path;
        std::optional<size_t> max_depth;
        std::optional<std::string> separator;
        bool show_version = false;
        bool show_help = false;
        int exit_code = 0;
        bool should_exit = false;
    };

    static ParseResult parse_arguments(int argc, char* argv[]);

   private:
    static bool parse_depth(const char* text, size_t& out);
};

void print_usage();

}  // namespace nestsh
