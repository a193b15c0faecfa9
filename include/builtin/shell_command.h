#pragma once

#include <string>
#include <vector>

#include "command_dispatcher.h"
#include "interpolation_parser.h"

namespace nestsh {

struct ShellOptions {
    ParserOptions parser;
    bool suppress_empty_replies = true;
};

extern const char* const SHELL_HELP_TEXT;

// Parses line, resolves its interpolations through the dispatcher, then
// dispatches the substituted text and replies with its joined output.
// Malformed input replies "Malformed command <line>" and returns 1.
int run_shell_line(CommandDispatcher& dispatcher, const std::string& line, ReplyContext& context,
                   const ShellOptions& options);

int shell_command(CommandDispatcher& dispatcher, const std::vector<std::string>& args,
                  ReplyContext& context, const ShellOptions& options);

}  // namespace nestsh
