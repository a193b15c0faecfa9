#include "interpolation_ast.h"

#include <algorithm>
#include <string>

namespace nestsh {

namespace {

void append_quoted(std::string& out, const std::string& text) {
    out += '"';
    for (char c : text) {
        if (c == '"' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    out += '"';
}

void dump_command(const Command& command, std::string& out) {
    out += '[';
    bool first = true;
    for (const auto& segment : command.segments) {
        if (!first) {
            out += ", ";
        }
        first = false;

        if (const auto* literal = std::get_if<Literal>(&segment)) {
            out += "lit(";
            append_quoted(out, literal->text);
            out += ')';
        } else {
            const auto& interpolation = std::get<Interpolation>(segment);
            out += "$(";
            dump_command(*interpolation.command, out);
            out += ')';
        }
    }
    out += ']';
}

}  // namespace

std::string dump_tree(const Command& command) {
    std::string out;
    dump_command(command, out);
    return out;
}

size_t nesting_depth(const Command& command) {
    size_t deepest = 0;
    for (const auto& segment : command.segments) {
        if (const auto* interpolation = std::get_if<Interpolation>(&segment)) {
            deepest = std::max(deepest, 1 + nesting_depth(*interpolation->command));
        }
    }
    return deepest;
}

}  // namespace nestsh
