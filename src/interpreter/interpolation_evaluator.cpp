#include "interpolation_evaluator.h"

#include <stdexcept>
#include <string>
#include <utility>

#include "utils/debug.h"

namespace nestsh {

InterpolationEvaluator::InterpolationEvaluator(CommandRunner runner) : runner_(std::move(runner)) {
    if (!runner_) {
        throw std::invalid_argument("InterpolationEvaluator requires a command runner");
    }
}

std::string InterpolationEvaluator::execute(const Command& command) const {
    PerformanceTracker tracker("InterpolationEvaluator::execute");
    return evaluate_command(command, 0);
}

std::string InterpolationEvaluator::evaluate_command(const Command& command, size_t depth) const {
    std::string output;
    for (const auto& segment : command.segments) {
        output += evaluate_segment(segment, depth);
    }
    return output;
}

std::string InterpolationEvaluator::evaluate_segment(const Segment& segment, size_t depth) const {
    if (const auto* literal = std::get_if<Literal>(&segment)) {
        return literal->text;
    }

    const auto& interpolation = std::get<Interpolation>(segment);
    std::string inner = evaluate_command(*interpolation.command, depth + 1);
    debug_msg("interpolation at offset %zu (depth %zu) runs '%s'", interpolation.offset, depth + 1,
              inner.c_str());

    std::string replaced = runner_(inner);
    debug_msg("interpolation at offset %zu returned '%s'", interpolation.offset,
              replaced.c_str());
    return replaced;
}

std::string execute_interpolations(const Command& command,
                                   const InterpolationEvaluator::CommandRunner& runner) {
    return InterpolationEvaluator(runner).execute(command);
}

}  // namespace nestsh
