#pragma once

#include <functional>
#include <string>

#include "interpolation_ast.h"

namespace nestsh {

class InterpolationEvaluator {
   public:
    // Runs one fully substituted command and returns its textual output.
    using CommandRunner = std::function<std::string(const std::string&)>;

    explicit InterpolationEvaluator(CommandRunner runner);

    // Resolves every interpolation depth-first, left to right, and returns
    // the substituted text of command. The runner is not called on the
    // returned text itself. Exceptions thrown by the runner propagate
    // unchanged and stop the evaluation.
    std::string execute(const Command& command) const;

   private:
    std::string evaluate_segment(const Segment& segment, size_t depth) const;
    std::string evaluate_command(const Command& command, size_t depth) const;

    CommandRunner runner_;
};

std::string execute_interpolations(const Command& command,
                                   const InterpolationEvaluator::CommandRunner& runner);

}  // namespace nestsh
