#include "error_out.h"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace nestsh {

std::string format_error(const ErrorInfo& error) {
    std::ostringstream out;
    out << "nestsh: ";

    if (!error.command_used.empty()) {
        out << error.command_used << ": ";
    }

    switch (error.type) {
        case ErrorType::COMMAND_NOT_FOUND:
            out << "command not found";
            break;
        case ErrorType::SYNTAX_ERROR:
            out << "syntax error";
            break;
        case ErrorType::FILE_NOT_FOUND:
            out << "file not found";
            break;
        case ErrorType::INVALID_ARGUMENT:
            out << "invalid argument";
            break;
        case ErrorType::RUNTIME_ERROR:
            out << "runtime error";
            break;
        case ErrorType::UNKNOWN_ERROR:
        default:
            out << "unknown error";
            break;
    }

    if (!error.message.empty()) {
        out << ": " << error.message;
    }

    out << '\n';

    for (const auto& suggestion : error.suggestions) {
        out << suggestion << '\n';
    }

    return out.str();
}

void print_error(const ErrorInfo& error) {
    std::cerr << format_error(error);
    std::cerr.flush();
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR), command_used(""), message(""), suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg)
    : type(t), command_used(cmd), message(msg), suggestions(sugg) {
}

}  // namespace nestsh
