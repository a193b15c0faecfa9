#pragma once

#include <string>
#include <vector>

#include "command_dispatcher.h"

namespace nestsh {

int help_command(const CommandDispatcher& dispatcher, const std::vector<std::string>& args,
                 ReplyContext& context);

}  // namespace nestsh
