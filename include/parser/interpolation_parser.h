#pragma once

#include <cstddef>
#include <string>

#include "interpolation_ast.h"
#include "utils/result.h"

namespace nestsh {

struct ParserOptions {
    // Deepest allowed $( ... ) nesting. 0 disables the limit.
    size_t max_depth = 0;
};

class InterpolationParser {
   public:
    explicit InterpolationParser(ParserOptions options = {});

    // Builds the segment tree for input. Malformed input (an unmatched "$("
    // or ")", or nesting beyond max_depth) yields an error Result and no tree.
    Result<Command> parse(const std::string& input) const;

    const ParserOptions& options() const {
        return options_;
    }

    static constexpr const char* OPEN_MARKER = "$(";
    static constexpr char CLOSE_MARKER = ')';
    static constexpr char ESCAPE_CHAR = '\\';

   private:
    ParserOptions options_;
};

Result<Command> parse_interpolations(const std::string& input, ParserOptions options = {});

}  // namespace nestsh
