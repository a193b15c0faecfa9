#include "case_commands.h"

#include "builtin_help.h"
#include "tokenizer.h"
#include "utf8_utils.h"

namespace nestsh {

int upper_command(const std::vector<std::string>& args, ReplyContext& context) {
    if (builtin_handle_help(args,
                            {"Usage: upper [STRING ...]",
                             "Reply with the arguments joined by spaces and upper-cased."},
                            context)) {
        return 0;
    }

    context.reply(utf8_utils::to_uppercase(Tokenizer::join_arguments(args)));
    return 0;
}

int lower_command(const std::vector<std::string>& args, ReplyContext& context) {
    if (builtin_handle_help(args,
                            {"Usage: lower [STRING ...]",
                             "Reply with the arguments joined by spaces and lower-cased."},
                            context)) {
        return 0;
    }

    context.reply(utf8_utils::to_lowercase(Tokenizer::join_arguments(args)));
    return 0;
}

}  // namespace nestsh
