#include "command_dispatcher.h"

#include <algorithm>
#include <string>
#include <utility>

#include "error_out.h"
#include "tokenizer.h"
#include "utils/debug.h"

namespace nestsh {

namespace {

class DepthGuard {
   public:
    explicit DepthGuard(size_t& depth) : depth_(depth) {
        ++depth_;
    }
    ~DepthGuard() {
        --depth_;
    }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    size_t& depth_;
};

}  // namespace

CommandFailure::CommandFailure(const std::string& command, int status)
    : std::runtime_error("command '" + command + "' failed with status " +
                         std::to_string(status)),
      command_(command),
      status_(status) {
}

void ReplyContext::say(const std::string& text) {
    (*out_) << text << '\n';
    out_->flush();
}

CommandDispatcher::CommandDispatcher(DispatcherOptions options, std::ostream& out)
    : options_(std::move(options)), out_(&out) {
    commands_.reserve(16);
}

void CommandDispatcher::register_command(const std::string& name, Handler handler,
                                         const std::string& help) {
    if (name.empty() || !handler) {
        throw std::invalid_argument("command registration requires a name and a handler");
    }
    commands_[name] = Entry{std::move(handler), help};
}

bool CommandDispatcher::has_command(const std::string& name) const {
    return commands_.find(name) != commands_.end();
}

std::vector<std::string> CommandDispatcher::command_names() const {
    std::vector<std::string> names;
    names.reserve(commands_.size());
    for (const auto& kv : commands_) {
        names.push_back(kv.first);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<std::string> CommandDispatcher::help_for(const std::string& name) const {
    auto it = commands_.find(name);
    if (it == commands_.end()) {
        return std::nullopt;
    }
    return it->second.help;
}

DispatchResult CommandDispatcher::dispatch(const std::string& text) {
    DispatchResult result;

    std::vector<std::string> args = Tokenizer::tokenize_command(text);
    if (args.empty()) {
        return result;
    }

    auto it = commands_.find(args[0]);
    if (it == commands_.end()) {
        if (options_.report_unknown_commands) {
            print_error({ErrorType::COMMAND_NOT_FOUND, args[0], "", {}});
        }
        result.status = STATUS_NOT_FOUND;
        return result;
    }

    DepthGuard guard(depth_);
    debug_msg("dispatch depth %zu: %s", depth_, text.c_str());

    ReplyContext context(*out_);
    result.status = it->second.handler(args, context);
    result.replies = context.replies();

    if (debug_enabled()) {
        debug_msg("command %s returned %s", text.c_str(), join_replies(result.replies).c_str());
    }
    return result;
}

std::string CommandDispatcher::capture(const std::string& text, int* status) {
    DispatchResult result = dispatch(text);
    if (status != nullptr) {
        *status = result.status;
    }
    if (options_.fail_on_error && result.status != 0 && result.replies.empty()) {
        throw CommandFailure(text, result.status);
    }
    return join_replies(result.replies);
}

InterpolationEvaluator::CommandRunner CommandDispatcher::runner() {
    return [this](const std::string& text) { return capture(text); };
}

std::string CommandDispatcher::join_replies(const std::vector<std::string>& replies) const {
    return Tokenizer::join_arguments(replies, 0, options_.reply_separator);
}

}  // namespace nestsh
