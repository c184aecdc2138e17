#pragma once

namespace bridgegrader {

/// How much the command-line program prints about a graded submission.
/// `Max` is just used as a sentinal for now
enum class VerbosityLevel {
    Silent,  ///< Nothing; only the exit code tells the outcome
    Quiet,   ///< Only the final score line
    Summary, ///< One line per case, plus the summary
    All,     ///< Also the feedback of every case
    Extra,   ///< Also extended feedback (interactor / checker diagnostics)
    Max
};

constexpr bool should_output_case(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_feedback(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return level >= All || (level >= Summary && !passed);
}

constexpr bool should_output_extended_feedback(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Extra;
}

constexpr bool should_output_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

/// Compile and internal errors are shown at every level but Silent
constexpr bool should_output_errors(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level > Silent;
}

} // namespace bridgegrader
