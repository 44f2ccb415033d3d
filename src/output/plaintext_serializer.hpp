#pragma once

#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>

#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace sandtest {

class PlainTextSerializer : public Serializer
{
public:
    PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option, VerbosityLevel verbosity);

    void on_submission_begin(const Problem& problem, std::string_view submission_name) override;
    void on_test_result(const TestCase& test_case, const TestResult& result) override;
    void on_submission_failure(const TestResult& result) override;
    void on_summary(std::span<const TestResult> results) override;
    void on_error(std::string_view what) override;

    void finalize() override;

    /// Conditionally make a word singular or plural based on `count`
    /// Singular if and only if `count == 1`
    ///
    /// Examples:
    ///  pluralize("test", 0) => "tests"
    ///  pluralize("case", 1) => "case"
    static std::string pluralize(std::string_view root, std::size_t count, std::string_view suffix = "s");

private:
    static bool process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option);
    static std::size_t get_terminal_width();

    /// Label for a result kind, e.g. "PASSED" or "TIMEOUT"
    std::string kind_label(TestOutcomeKind kind) const;

    void write_stream(std::string_view label, const std::optional<std::string>& text);

    template <typename T>
    std::string style_str(const T& arg, fmt::text_style style) const;

    // Basic styles for different kinds of output:
    //   error    - FAILED messages, fatal errors, etc.
    //   success  - PASSED messages
    //   value    - test case inputs and captured output
    static constexpr auto ERROR_STYLE = fmt::fg(fmt::color::red) | fmt::emphasis::bold;
    static constexpr auto WARNING_STYLE = fmt::fg(fmt::color::yellow) | fmt::emphasis::bold;
    static constexpr auto SUCCESS_STYLE = fmt::fg(fmt::color::lime_green);
    static constexpr auto POP_OUT_STYLE =
        fmt::emphasis::underline | fmt::emphasis::bold | fmt::fg(fmt::color::golden_rod);
    static constexpr auto VALUE_STYLE = fmt::fg(fmt::color::aqua);

    static constexpr std::size_t DEFAULT_WIDTH = 80;

    static constexpr auto MAKE_LINE_DIVIDER = [](char chr) {
        return [chr](std::size_t len) { return std::string(len, chr); };
    };

    // Line Divider Emphasized    : "======="...
    // Line Divider               : "--------...
    static const inline auto LINE_DIVIDER = MAKE_LINE_DIVIDER('-');
    static const inline auto LINE_DIVIDER_EM = MAKE_LINE_DIVIDER('=');

    bool do_colorize_;
    std::size_t terminal_width_;
};

template <typename T>
std::string PlainTextSerializer::style_str(const T& arg, fmt::text_style style) const {
    if (!do_colorize_) {
        return fmt::format("{}", arg);
    }

    return fmt::format(style, "{}", arg);
}

} // namespace sandtest
