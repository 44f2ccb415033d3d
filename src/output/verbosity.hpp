#pragma once

namespace sandtest {

/// `Max` is just used as a sentinal for now
enum class VerbosityLevel {
    Silent,  ///< Nothing is output; only the exit code reports results
    Quiet,   ///< Only the final pass/fail summary
    Summary, ///< Failing test cases and the summary
    All,     ///< Every test case and the summary
    Extra,   ///< As All, plus each test case's captured stdout and stderr
    Max      ///< Sentinel
};

/// See \ref VerbosityLevel
constexpr bool should_output_test_result(VerbosityLevel level, bool passed) {
    using enum VerbosityLevel;

    return (level >= All || (level >= Summary && !passed));
}

/// See \ref VerbosityLevel
constexpr bool should_output_captured_streams(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Extra);
}

/// See \ref VerbosityLevel
constexpr bool should_output_summary(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level >= Quiet);
}

/// See \ref VerbosityLevel
constexpr bool should_output_errors(VerbosityLevel level) {
    using enum VerbosityLevel;

    return (level > Silent);
}

} // namespace sandtest
