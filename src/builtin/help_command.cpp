#include "help_command.h"

#include "builtin_help.h"
#include "tokenizer.h"

namespace nestsh {

int help_command(const CommandDispatcher& dispatcher, const std::vector<std::string>& args,
                 ReplyContext& context) {
    if (builtin_handle_help(
            args,
            {"Usage: help [COMMAND]",
             "Without COMMAND, list the available commands. With COMMAND, describe it."},
            context)) {
        return 0;
    }

    if (args.size() < 2) {
        context.reply("commands: " + Tokenizer::join_arguments(dispatcher.command_names(), 0, ", "));
        return 0;
    }

    auto help = dispatcher.help_for(args[1]);
    if (!help) {
        context.reply("no help for " + args[1]);
        return 1;
    }

    context.reply(*help);
    return 0;
}

}  // namespace nestsh
