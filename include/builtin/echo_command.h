#pragma once

#include <string>
#include <vector>

#include "command_dispatcher.h"

namespace nestsh {

int echo_command(const std::vector<std::string>& args, ReplyContext& context);

int say_command(const std::vector<std::string>& args, ReplyContext& context);

int ping_command(const std::vector<std::string>& args, ReplyContext& context);

}  // namespace nestsh
