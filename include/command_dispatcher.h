#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "interpolation_evaluator.h"

namespace nestsh {

// Raised by CommandDispatcher::capture when fail_on_error is set and a
// command exits non-zero without replying.
class CommandFailure : public std::runtime_error {
   public:
    CommandFailure(const std::string& command, int status);

    const std::string& command() const {
        return command_;
    }
    int status() const {
        return status_;
    }

   private:
    std::string command_;
    int status_;
};

// Per-invocation sink handed to a command handler. reply() output is
// collected and can be interpolated; say() goes straight to the session.
class ReplyContext {
   public:
    explicit ReplyContext(std::ostream& out) : out_(&out) {
    }

    void reply(const std::string& text) {
        replies_.push_back(text);
    }

    void say(const std::string& text);

    const std::vector<std::string>& replies() const {
        return replies_;
    }

   private:
    std::ostream* out_;
    std::vector<std::string> replies_;
};

struct DispatchResult {
    int status = 0;
    std::vector<std::string> replies;
};

struct DispatcherOptions {
    std::string reply_separator = " ";
    bool report_unknown_commands = true;
    bool fail_on_error = false;
};

class CommandDispatcher {
   public:
    using Handler = std::function<int(const std::vector<std::string>&, ReplyContext&)>;

    explicit CommandDispatcher(DispatcherOptions options = {}, std::ostream& out = std::cout);

    CommandDispatcher(const CommandDispatcher&) = delete;
    CommandDispatcher& operator=(const CommandDispatcher&) = delete;

    void register_command(const std::string& name, Handler handler, const std::string& help);
    bool has_command(const std::string& name) const;
    std::vector<std::string> command_names() const;
    std::optional<std::string> help_for(const std::string& name) const;

    // Runs text as one independent command. Exceptions thrown by the handler
    // propagate to the caller.
    DispatchResult dispatch(const std::string& text);

    // dispatch() plus reply joining; the shape interpolation needs. The
    // command's exit status is stored in status when it is not null.
    std::string capture(const std::string& text, int* status = nullptr);

    InterpolationEvaluator::CommandRunner runner();

    std::string join_replies(const std::vector<std::string>& replies) const;

    size_t depth() const {
        return depth_;
    }

    const DispatcherOptions& options() const {
        return options_;
    }

    std::ostream& output() {
        return *out_;
    }

    static constexpr int STATUS_NOT_FOUND = 127;

   private:
    struct Entry {
        Handler handler;
        std::string help;
    };

    std::unordered_map<std::string, Entry> commands_;
    DispatcherOptions options_;
    std::ostream* out_;
    size_t depth_ = 0;
};

}  // namespace nestsh
