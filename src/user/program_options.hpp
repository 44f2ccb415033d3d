#pragma once

#include <sandtest/common/error_types.hpp>
#include <sandtest/common/expected.hpp>
#include <sandtest/common/formatters.hpp>

#include "output/verbosity.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sandtest {

struct ProgramOptions
{

    // ###### Argument fields

    /// Level of verbosity for cli output.
    VerbosityLevel verbosity = DEFAULT_VERBOSITY_LEVEL;

    /// Name of the member function under test
    std::string method_name;

    std::filesystem::path submission_path;
    std::filesystem::path tests_path;

    /// Headers to include beyond the default set
    std::vector<std::string> extra_includes;

    std::chrono::milliseconds timeout = DEFAULT_TIMEOUT;

    /// Compiler executable. `$CXX` or g++ when empty
    std::string compiler;

    /// Maximum number of concurrent workers. 0 = one per test case
    std::size_t jobs = 0;

    enum class ColorizeOpt { Auto, Always, Never } colorize_option = ColorizeOpt::Auto;

    // ###### Argument defaults

    static constexpr auto DEFAULT_TIMEOUT = std::chrono::milliseconds{2000};
    static constexpr auto DEFAULT_VERBOSITY_LEVEL = VerbosityLevel::Summary;

    static Expected<void, std::string> ensure_is_regular_file(const std::filesystem::path& path,
                                                              fmt::format_string<std::string> fmt) {
        if (!std::filesystem::exists(path)) {
            return (fmt::format(fmt, path.string()) + " does not exist");
        }

        if (!std::filesystem::is_regular_file(path)) {
            return (fmt::format(fmt, path.string()) + " is not a regular file");
        }

        return {};
    }

    /// Verify that all fields are valid
    Expected<void, std::string> validate() const {
        if (method_name.empty()) {
            return std::string{"Method name must not be empty"};
        }

        if (timeout <= std::chrono::milliseconds::zero()) {
            return fmt::format("Timeout must be positive (got {}ms)", timeout.count());
        }

        TRY(ensure_is_regular_file(submission_path, "Submission file {:?}"));
        TRY(ensure_is_regular_file(tests_path, "Test case file {:?}"));

        return {};
    }
};

} // namespace sandtest

FMT_SERIALIZE_ENUM(::sandtest::VerbosityLevel, Silent, Quiet, Summary, All, Extra, Max);
FMT_SERIALIZE_ENUM(::sandtest::ProgramOptions::ColorizeOpt, Auto, Always, Never);

template <>
struct fmt::formatter<::sandtest::ProgramOptions> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::ProgramOptions& from, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "{{verbosity={}, method={}, submission={}, tests={}, includes={}, timeout={}ms, "
                              "compiler={:?}, jobs={}, color_opt={}}}",
                              from.verbosity, from.method_name, from.submission_path.string(),
                              from.tests_path.string(), from.extra_includes, from.timeout.count(), from.compiler,
                              from.jobs, from.colorize_option);
    }
};
