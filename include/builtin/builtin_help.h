#pragma once

#include <string>
#include <vector>

#include "command_dispatcher.h"

namespace nestsh {

// Replies with help_lines and returns true when args[1] is --help or -h.
bool builtin_handle_help(const std::vector<std::string>& args,
                         const std::vector<std::string>& help_lines, ReplyContext& context);

}  // namespace nestsh
