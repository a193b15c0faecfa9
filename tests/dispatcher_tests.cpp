#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "command_dispatcher.h"
#include "interpolation_parser.h"

using namespace nestsh;

namespace {

DispatcherOptions quiet_options() {
    DispatcherOptions options;
    options.report_unknown_commands = false;
    return options;
}

int reply_args(const std::vector<std::string>& args, ReplyContext& context) {
    for (size_t i = 1; i < args.size(); ++i) {
        context.reply(args[i]);
    }
    return 0;
}

}  // namespace

TEST(CommandDispatcher, DispatchCollectsRepliesAndStatus) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    dispatcher.register_command(
        "pair",
        [](const std::vector<std::string>& args, ReplyContext& context) {
            context.reply("first " + args[1]);
            context.reply("second");
            return 4;
        },
        "pair X");

    DispatchResult result = dispatcher.dispatch("pair   x");
    EXPECT_EQ(result.status, 4);
    EXPECT_EQ(result.replies, std::vector<std::string>({"first x", "second"}));
    EXPECT_TRUE(out.str().empty());
}

TEST(CommandDispatcher, CaptureJoinsRepliesWithSeparator) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    dispatcher.register_command("args", reply_args, "args...");

    EXPECT_EQ(dispatcher.capture("args a b c"), "a b c");
    EXPECT_EQ(dispatcher.capture("args"), "");
}

TEST(CommandDispatcher, CaptureReportsExitStatus) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    dispatcher.register_command(
        "partial",
        [](const std::vector<std::string>&, ReplyContext& context) {
            context.reply("half");
            return 6;
        },
        "partial");

    int status = -1;
    EXPECT_EQ(dispatcher.capture("partial", &status), "half");
    EXPECT_EQ(status, 6);
    EXPECT_EQ(dispatcher.capture("nosuch", &status), "");
    EXPECT_EQ(status, CommandDispatcher::STATUS_NOT_FOUND);
}

TEST(CommandDispatcher, CustomSeparator) {
    std::ostringstream out;
    DispatcherOptions options = quiet_options();
    options.reply_separator = "|";
    CommandDispatcher dispatcher(options, out);
    dispatcher.register_command("args", reply_args, "args...");

    EXPECT_EQ(dispatcher.capture("args a b"), "a|b");
}

TEST(CommandDispatcher, UnknownCommandHasNoReplies) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);

    DispatchResult result = dispatcher.dispatch("nosuch thing");
    EXPECT_EQ(result.status, CommandDispatcher::STATUS_NOT_FOUND);
    EXPECT_TRUE(result.replies.empty());
    EXPECT_EQ(dispatcher.capture("nosuch thing"), "");
}

TEST(CommandDispatcher, BlankCommandDoesNothing) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);

    DispatchResult result = dispatcher.dispatch("   ");
    EXPECT_EQ(result.status, 0);
    EXPECT_TRUE(result.replies.empty());
}

// say output bypasses reply collection
TEST(CommandDispatcher, SayWritesToSessionOutput) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    dispatcher.register_command(
        "announce",
        [](const std::vector<std::string>&, ReplyContext& context) {
            context.say("hello channel");
            return 0;
        },
        "announce");

    EXPECT_EQ(dispatcher.capture("announce"), "");
    EXPECT_EQ(out.str(), "hello channel\n");
}

TEST(CommandDispatcher, FailOnErrorRaisesCommandFailure) {
    std::ostringstream out;
    DispatcherOptions options = quiet_options();
    options.fail_on_error = true;
    CommandDispatcher dispatcher(options, out);
    dispatcher.register_command(
        "broken", [](const std::vector<std::string>&, ReplyContext&) { return 3; }, "broken");
    dispatcher.register_command(
        "grumpy",
        [](const std::vector<std::string>&, ReplyContext& context) {
            context.reply("still answered");
            return 1;
        },
        "grumpy");

    try {
        dispatcher.capture("broken now");
        FAIL() << "expected CommandFailure";
    } catch (const CommandFailure& e) {
        EXPECT_EQ(e.command(), "broken now");
        EXPECT_EQ(e.status(), 3);
    }

    EXPECT_EQ(dispatcher.capture("grumpy"), "still answered");
    EXPECT_THROW(dispatcher.capture("nosuch"), CommandFailure);
}

TEST(CommandDispatcher, TracksNestedDispatchDepth) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    std::vector<size_t> seen;

    dispatcher.register_command(
        "inner",
        [&](const std::vector<std::string>&, ReplyContext&) {
            seen.push_back(dispatcher.depth());
            return 0;
        },
        "inner");
    dispatcher.register_command(
        "outer",
        [&](const std::vector<std::string>&, ReplyContext& context) {
            seen.push_back(dispatcher.depth());
            context.reply(dispatcher.capture("inner"));
            return 0;
        },
        "outer");

    dispatcher.dispatch("outer");
    EXPECT_EQ(seen, std::vector<size_t>({1, 2}));
    EXPECT_EQ(dispatcher.depth(), 0u);
}

TEST(CommandDispatcher, DepthRestoredWhenHandlerThrows) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    dispatcher.register_command(
        "explode",
        [](const std::vector<std::string>&, ReplyContext&) -> int {
            throw std::runtime_error("explode");
        },
        "explode");

    EXPECT_THROW(dispatcher.dispatch("explode"), std::runtime_error);
    EXPECT_EQ(dispatcher.depth(), 0u);
}

TEST(CommandDispatcher, CommandNamesAreSortedAndHelpIsKept) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    dispatcher.register_command("zeta", reply_args, "zeta help");
    dispatcher.register_command("alpha", reply_args, "alpha help");

    EXPECT_EQ(dispatcher.command_names(), std::vector<std::string>({"alpha", "zeta"}));
    EXPECT_TRUE(dispatcher.has_command("zeta"));
    EXPECT_FALSE(dispatcher.has_command("beta"));
    ASSERT_TRUE(dispatcher.help_for("alpha").has_value());
    EXPECT_EQ(*dispatcher.help_for("alpha"), "alpha help");
    EXPECT_FALSE(dispatcher.help_for("beta").has_value());
}

TEST(CommandDispatcher, RegistrationRequiresNameAndHandler) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    EXPECT_THROW(dispatcher.register_command("", reply_args, ""), std::invalid_argument);
    EXPECT_THROW(dispatcher.register_command("x", CommandDispatcher::Handler{}, ""),
                 std::invalid_argument);
}

// the runner plugs straight into the evaluator
TEST(CommandDispatcher, RunnerDrivesInterpolation) {
    std::ostringstream out;
    CommandDispatcher dispatcher(quiet_options(), out);
    dispatcher.register_command("args", reply_args, "args...");

    auto parsed = parse_interpolations("<$(args a $(args b c))>");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(InterpolationEvaluator(dispatcher.runner()).execute(parsed.value()), "<a b c>");
}
