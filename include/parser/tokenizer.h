#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace nestsh {

class Tokenizer {
   public:
    // Splits on runs of ASCII whitespace. No quoting or escape handling;
    // interpolation escapes are resolved before a command reaches here.
    static std::vector<std::string> tokenize_command(const std::string& cmdline);

    static std::string join_arguments(const std::vector<std::string>& args, size_t start = 1,
                                      const std::string& separator = " ");

    static bool is_blank(const std::string& text);
};

}  // namespace nestsh
