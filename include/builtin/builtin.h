#pragma once

#include "command_dispatcher.h"
#include "shell_command.h"

namespace nestsh {

// Registers echo, say, ping, upper, lower, help and shell on dispatcher.
void register_builtin_commands(CommandDispatcher& dispatcher, const ShellOptions& shell_options);

}  // namespace nestsh
