#pragma once

#include <iostream>
#include <string>

#include "command_dispatcher.h"
#include "config.h"
#include "shell_command.h"

namespace nestsh {

/**
 * One interactive or scripted session: a dispatcher with the builtin
 * commands registered and the shell options derived from a Config.
 */
class ShellSession {
   public:
    explicit ShellSession(const Config& config, std::ostream& out = std::cout);

    ShellSession(const ShellSession&) = delete;
    ShellSession& operator=(const ShellSession&) = delete;

    /**
     * Run one input line as the argument of the shell command and print its
     * replies, one per line.
     * @return 0 on success, 1 for malformed input or a failing callback,
     *         otherwise the status of the outer command
     */
    int process_command_line(const std::string& line);

    CommandDispatcher& dispatcher() {
        return dispatcher_;
    }

    const Config& config() const {
        return config_;
    }

   private:
    Config config_;
    std::ostream* out_;
    CommandDispatcher dispatcher_;
    ShellOptions shell_options_;
};

/**
 * Read lines from in until EOF, "exit" or "quit", running each through the
 * session. The prompt is written only when interactive is set.
 * @return status of the last line that ran
 */
int main_process_loop(ShellSession& session, std::istream& in, bool interactive);

}  // namespace nestsh
