#pragma once

namespace iojudge {

/// `Max` is just used as a sentinal
enum class VerbosityLevel {
    Silent,  ///< Nothing but the exit code
    Quiet,   ///< Transcripts of `run`; the score of `grade`
    Summary, ///< + every failing test case, with the first mismatch
    All,     ///< + passing test cases, and observed transcripts of failing ones
    Extra,   ///< + timing and resource usage of every execution
    Max
};

constexpr bool should_output_test_result(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Summary && !passed));
}

constexpr bool should_output_observed_transcript(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= All);
}

constexpr bool should_output_grade_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Quiet);
}

constexpr bool should_output_transcripts(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Quiet);
}

constexpr bool should_output_resource_usage(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Extra);
}

constexpr bool should_output_run_metadata(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Summary);
}

} // namespace iojudge
