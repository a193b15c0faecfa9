#include "interpolation_parser.h"

#include <memory>
#include <string>
#include <utility>

#include "utils/debug.h"
#include "utf8_utils.h"

namespace nestsh {

namespace {

class InterpolationScanner {
   public:
    InterpolationScanner(const std::string& input, size_t max_depth)
        : input_(input), max_depth_(max_depth) {
    }

    bool parse_root(Command& root) {
        return parse_command(root, 0, std::string::npos);
    }

    const std::string& error() const {
        return error_;
    }

   private:
    bool at_open_marker() const {
        return input_.compare(pos_, 2, InterpolationParser::OPEN_MARKER) == 0;
    }

    bool fail(std::string message) {
        error_ = std::move(message);
        return false;
    }

    void flush_literal(Command& command, std::string& pending, size_t pending_offset) {
        if (pending.empty()) {
            return;
        }
        command.segments.emplace_back(Literal{std::move(pending), pending_offset});
        pending.clear();
    }

    // open_offset is the position of the "$(" that introduced this command,
    // or npos for the top level.
    bool parse_command(Command& command, size_t depth, size_t open_offset) {
        const bool nested = open_offset != std::string::npos;
        command.offset = pos_;

        std::string pending;
        size_t pending_offset = pos_;

        while (pos_ < input_.size()) {
            if (at_open_marker()) {
                flush_literal(command, pending, pending_offset);
                if (!parse_interpolation(command, depth)) {
                    return false;
                }
                pending_offset = pos_;
                continue;
            }

            char c = input_[pos_];
            if (c == InterpolationParser::CLOSE_MARKER) {
                if (!nested) {
                    return fail("unmatched ')' at offset " + std::to_string(pos_));
                }
                flush_literal(command, pending, pending_offset);
                ++pos_;
                return true;
            }

            if (pending.empty()) {
                pending_offset = pos_;
            }

            if (c == InterpolationParser::ESCAPE_CHAR && pos_ + 1 < input_.size()) {
                ++pos_;
                if (at_open_marker()) {
                    pending += InterpolationParser::OPEN_MARKER;
                    pos_ += 2;
                } else {
                    size_t unit = utf8_utils::codepoint_length(input_, pos_);
                    pending.append(input_, pos_, unit);
                    pos_ += unit;
                }
                continue;
            }

            pending += c;
            ++pos_;
        }

        if (nested) {
            return fail("unmatched '$(' at offset " + std::to_string(open_offset));
        }

        flush_literal(command, pending, pending_offset);
        return true;
    }

    bool parse_interpolation(Command& parent, size_t depth) {
        const size_t open_offset = pos_;
        if (max_depth_ != 0 && depth + 1 > max_depth_) {
            return fail("nesting depth exceeded (limit " + std::to_string(max_depth_) +
                        ") at offset " + std::to_string(open_offset));
        }

        pos_ += 2;
        Interpolation interpolation;
        interpolation.offset = open_offset;
        interpolation.command = std::make_unique<Command>();
        if (!parse_command(*interpolation.command, depth + 1, open_offset)) {
            return false;
        }

        parent.segments.emplace_back(std::move(interpolation));
        return true;
    }

    const std::string& input_;
    size_t max_depth_;
    size_t pos_ = 0;
    std::string error_;
};

}  // namespace

InterpolationParser::InterpolationParser(ParserOptions options) : options_(options) {
}

Result<Command> InterpolationParser::parse(const std::string& input) const {
    PerformanceTracker tracker("InterpolationParser::parse");

    InterpolationScanner scanner(input, options_.max_depth);
    Command root;
    if (!scanner.parse_root(root)) {
        debug_msg("parse failed for '%s': %s", input.c_str(), scanner.error().c_str());
        return Result<Command>::error(scanner.error());
    }

    debug_msg("parsed '%s' into %zu top-level segments", input.c_str(), root.segments.size());
    return Result<Command>::ok(std::move(root));
}

Result<Command> parse_interpolations(const std::string& input, ParserOptions options) {
    return InterpolationParser(options).parse(input);
}

}  // namespace nestsh
