#pragma once

#include <string>
#include <vector>

#include "command_dispatcher.h"

namespace nestsh {

int upper_command(const std::vector<std::string>& args, ReplyContext& context);

int lower_command(const std::vector<std::string>& args, ReplyContext& context);

}  // namespace nestsh
