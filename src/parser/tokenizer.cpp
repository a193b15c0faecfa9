#include "tokenizer.h"

#include <cctype>

namespace nestsh {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

std::vector<std::string> Tokenizer::tokenize_command(const std::string& cmdline) {
    std::vector<std::string> tokens;
    std::string current;

    for (char c : cmdline) {
        if (is_space(c)) {
            if (!current.empty()) {
                tokens.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }

    if (!current.empty()) {
        tokens.push_back(current);
    }

    return tokens;
}

std::string Tokenizer::join_arguments(const std::vector<std::string>& args, size_t start,
                                      const std::string& separator) {
    std::string joined;
    for (size_t i = start; i < args.size(); ++i) {
        if (i > start) {
            joined += separator;
        }
        joined += args[i];
    }
    return joined;
}

bool Tokenizer::is_blank(const std::string& text) {
    for (char c : text) {
        if (!is_space(c)) {
            return false;
        }
    }
    return true;
}

}  // namespace nestsh
