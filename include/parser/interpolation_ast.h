#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace nestsh {

struct Command;

// Decoded text; escape backslashes are already consumed.
struct Literal {
    std::string text;
    size_t offset = 0;
};

// A $( ... ) span. Owns the command parsed from between the markers.
struct Interpolation {
    std::unique_ptr<Command> command;
    size_t offset = 0;
};

using Segment = std::variant<Literal, Interpolation>;

// Ordered segments in source order. Never holds two adjacent Literals or an
// empty Literal.
struct Command {
    std::vector<Segment> segments;
    size_t offset = 0;

    Command() = default;
    Command(Command&&) = default;
    Command& operator=(Command&&) = default;
    Command(const Command&) = delete;
    Command& operator=(const Command&) = delete;

    bool empty() const {
        return segments.empty();
    }
};

// One-line structural rendering, e.g. [lit("a "), $([lit("b")]), lit(" c")].
std::string dump_tree(const Command& command);

// Number of interpolations on the deepest path through the tree.
size_t nesting_depth(const Command& command);

}  // namespace nestsh
