#include "builtin_help.h"

namespace nestsh {

bool builtin_handle_help(const std::vector<std::string>& args,
                         const std::vector<std::string>& help_lines, ReplyContext& context) {
    if (args.size() > 1) {
        const std::string& flag = args[1];
        if (flag == "--help" || flag == "-h") {
            for (const auto& line : help_lines) {
                context.reply(line);
            }
            return true;
        }
    }
    return false;
}

}  // namespace nestsh
