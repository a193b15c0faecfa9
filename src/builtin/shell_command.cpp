#include "shell_command.h"

#include "builtin_help.h"
#include "error_out.h"
#include "interpolation_evaluator.h"
#include "tokenizer.h"
#include "utils/debug.h"

namespace nestsh {

const char* const SHELL_HELP_TEXT =
    "shell TEXT: run TEXT after replacing every $(COMMAND) with the replies of COMMAND. "
    "For example \"shell say $(ping)\" says pong. Interpolations nest and the innermost runs "
    "first. Only replies are interpolated, so output written by say is not. "
    "Write \\$( and \\) to keep the markers literal.";

int run_shell_line(CommandDispatcher& dispatcher, const std::string& line, ReplyContext& context,
                   const ShellOptions& options) {
    auto parsed = InterpolationParser(options.parser).parse(line);
    if (parsed.is_error()) {
        print_error({ErrorType::SYNTAX_ERROR, "shell", parsed.error(), {}});
        context.reply("Malformed command " + line);
        return 1;
    }

    debug_msg("shell tree for '%s': %s", line.c_str(), dump_tree(parsed.value()).c_str());

    InterpolationEvaluator evaluator(dispatcher.runner());
    std::string outer = evaluator.execute(parsed.value());

    int status = 0;
    std::string text = dispatcher.capture(outer, &status);
    if (!text.empty() || !options.suppress_empty_replies) {
        context.reply(text);
    }
    return status;
}

int shell_command(CommandDispatcher& dispatcher, const std::vector<std::string>& args,
                  ReplyContext& context, const ShellOptions& options) {
    if (builtin_handle_help(args, {"Usage: shell TEXT...", SHELL_HELP_TEXT}, context)) {
        return 0;
    }

    if (args.size() < 2) {
        context.reply("Usage: shell TEXT...");
        return 2;
    }

    return run_shell_line(dispatcher, Tokenizer::join_arguments(args), context, options);
}

}  // namespace nestsh
