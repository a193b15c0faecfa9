#include "echo_command.h"

#include "builtin_help.h"
#include "tokenizer.h"

namespace nestsh {

int echo_command(const std::vector<std::string>& args, ReplyContext& context) {
    if (builtin_handle_help(
            args, {"Usage: echo [STRING ...]", "Reply with the arguments joined by spaces."},
            context)) {
        return 0;
    }

    context.reply(Tokenizer::join_arguments(args));
    return 0;
}

int say_command(const std::vector<std::string>& args, ReplyContext& context) {
    if (builtin_handle_help(args,
                            {"Usage: say [STRING ...]",
                             "Write the arguments to the session output.",
                             "say does not reply, so $(say ...) interpolates as nothing."},
                            context)) {
        return 0;
    }

    context.say(Tokenizer::join_arguments(args));
    return 0;
}

int ping_command(const std::vector<std::string>& args, ReplyContext& context) {
    if (builtin_handle_help(args, {"Usage: ping", "Reply with pong."}, context)) {
        return 0;
    }

    context.reply("pong");
    return 0;
}

}  // namespace nestsh
