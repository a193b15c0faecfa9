#include "main_loop.h"

#include <exception>
#include <string>

#include "builtin.h"
#include "error_out.h"
#include "tokenizer.h"
#include "utils/debug.h"

namespace nestsh {

namespace {

bool is_exit_command(const std::string& line) {
    auto args = Tokenizer::tokenize_command(line);
    return args.size() == 1 && (args[0] == "exit" || args[0] == "quit");
}

}  // namespace

ShellSession::ShellSession(const Config& config, std::ostream& out)
    : config_(config), out_(&out), dispatcher_(config.dispatcher_options(), out) {
    shell_options_.parser = config_.parser_options();
    shell_options_.suppress_empty_replies = config_.suppress_empty_replies;
    register_builtin_commands(dispatcher_, shell_options_);
}

int ShellSession::process_command_line(const std::string& line) {
    ReplyContext context(*out_);
    int status = 0;

    try {
        status = run_shell_line(dispatcher_, line, context, shell_options_);
    } catch (const CommandFailure& e) {
        print_error({ErrorType::RUNTIME_ERROR, e.command(), e.what(), {}});
        return 1;
    } catch (const std::exception& e) {
        print_error({ErrorType::RUNTIME_ERROR, "shell", e.what(), {}});
        return 1;
    }

    for (const auto& reply : context.replies()) {
        (*out_) << reply << '\n';
    }
    out_->flush();
    return status;
}

int main_process_loop(ShellSession& session, std::istream& in, bool interactive) {
    int last_status = 0;
    std::string line;

    while (true) {
        if (interactive) {
            std::cout << session.config().prompt;
            std::cout.flush();
        }

        if (!std::getline(in, line)) {
            break;
        }

        if (Tokenizer::is_blank(line)) {
            continue;
        }
        if (is_exit_command(line)) {
            debug_msg("exit requested");
            break;
        }

        last_status = session.process_command_line(line);
    }

    if (interactive) {
        std::cout << std::endl;
    }
    return last_status;
}

}  // namespace nestsh
