#pragma once

#include <string>
#include <vector>

#include <cstdint>

namespace nestsh {

enum class ErrorType : std::uint8_t {
    COMMAND_NOT_FOUND,
    SYNTAX_ERROR,
    FILE_NOT_FOUND,
    INVALID_ARGUMENT,
    RUNTIME_ERROR,
    UNKNOWN_ERROR
};

struct ErrorInfo {
    ErrorType type;
    std::string command_used;
    std::string message;
    std::vector<std::string> suggestions;

    ErrorInfo();

    ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
              const std::vector<std::string>& sugg);
};

void print_error(const ErrorInfo& error);

std::string format_error(const ErrorInfo& error);

}  // namespace nestsh
