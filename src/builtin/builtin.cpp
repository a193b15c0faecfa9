#include "builtin.h"

#include "case_commands.h"
#include "echo_command.h"
#include "help_command.h"
#include "shell_command.h"

namespace nestsh {

void register_builtin_commands(CommandDispatcher& dispatcher, const ShellOptions& shell_options) {
    dispatcher.register_command("echo", echo_command, "echo TEXT: reply with TEXT.");
    dispatcher.register_command("say", say_command,
                                "say TEXT: write TEXT to the session without replying.");
    dispatcher.register_command("ping", ping_command, "ping: reply with pong.");
    dispatcher.register_command("upper", upper_command, "upper TEXT: reply with TEXT upper-cased.");
    dispatcher.register_command("lower", lower_command, "lower TEXT: reply with TEXT lower-cased.");

    dispatcher.register_command(
        "help",
        [&dispatcher](const std::vector<std::string>& args, ReplyContext& context) {
            return help_command(dispatcher, args, context);
        },
        "help [COMMAND]: list commands or describe COMMAND.");

    dispatcher.register_command(
        "shell",
        [&dispatcher, shell_options](const std::vector<std::string>& args,
                                     ReplyContext& context) {
            return shell_command(dispatcher, args, context, shell_options);
        },
        SHELL_HELP_TEXT);
}

}  // namespace nestsh
