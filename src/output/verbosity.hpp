#pragma once

namespace judgebox {

/// How much the CLI prints. `Max` is just used as a sentinel.
///   Silent  - nothing; the exit code is the only output
///   Quiet   - one short line per submission
///   Summary - verdict lines with diagnostics, plus a batch summary
///   All     - additionally resource usage and stderr of every run
enum class VerbosityLevel { Silent, Quiet, Summary, All, Max };

constexpr bool should_output_verdict(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Quiet;
}

constexpr bool should_output_verdict_message(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= Summary;
}

constexpr bool should_output_usage(VerbosityLevel level) {
    using enum VerbosityLevel;

    return level >= All;
}

constexpr bool should_output_summary(VerbosityLevel level, bool is_batch) {
    using enum VerbosityLevel;

    return (is_batch && level >= Summary) || level >= All;
}

} // namespace judgebox
