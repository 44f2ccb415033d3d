#include "output/plaintext_serializer.hpp"

#include <sandtest/logging.hpp>
#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>

#include "common/terminal_checks.hpp"
#include "output/serializer.hpp"
#include "output/sink.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <fmt/color.h>
#include <fmt/format.h>
#include <range/v3/algorithm/count_if.hpp>

#include <cstddef>
#include <cstdio>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <sys/ioctl.h>

namespace sandtest {

PlainTextSerializer::PlainTextSerializer(Sink& sink, ProgramOptions::ColorizeOpt colorize_option,
                                         VerbosityLevel verbosity)
    : Serializer{sink, verbosity}
    , do_colorize_{process_colorize_opt(colorize_option)}
    , terminal_width_{get_terminal_width()} {}

void PlainTextSerializer::on_submission_begin(const Problem& problem, std::string_view submission_name) {
    if (!should_output_summary(verbosity_)) {
        return;
    }

    std::string out = fmt::format("{0}\nSubmission: {1}\nMethod: {2}\n{0}\n", LINE_DIVIDER_EM(terminal_width_),
                                  style_str(submission_name, POP_OUT_STYLE), problem.test_name);

    sink_.write(out);
}

void PlainTextSerializer::on_test_result(const TestCase& test_case, const TestResult& result) {
    if (!should_output_test_result(verbosity_, result.passed())) {
        return;
    }

    std::string out = fmt::format("{} {} : {}\n", kind_label(result.kind), test_case.name, result.message);
    sink_.write(out);

    if (should_output_captured_streams(verbosity_)) {
        write_stream("stdout", result.captured_stdout);
        write_stream("stderr", result.captured_stderr);
    }
}

void PlainTextSerializer::on_submission_failure(const TestResult& result) {
    if (!should_output_errors(verbosity_)) {
        return;
    }

    std::string out = fmt::format("{}\n{}\n", kind_label(result.kind), result.message);
    sink_.write(out);
}

void PlainTextSerializer::on_summary(std::span<const TestResult> results) {
    if (!should_output_summary(verbosity_)) {
        return;
    }

    std::string out = LINE_DIVIDER(terminal_width_) + "\n";

    // Mostly copying Catch2's result summary format
    auto num_passed = static_cast<std::size_t>(ranges::count_if(results, &TestResult::passed));
    std::size_t num_failed = results.size() - num_passed;

    if (num_failed == 0) {
        out += fmt::format("{} ({} {})\n", style_str("All test cases passed", SUCCESS_STYLE), results.size(),
                           pluralize("test case", results.size()));
        sink_.write(out);
        return;
    }

    std::string passed_msg = fmt::format("{} passed", num_passed);
    std::string failed_msg = fmt::format("{} failed", num_failed);

    out += fmt::format("Test cases: {} total | {} | {}\n", results.size(), style_str(passed_msg, SUCCESS_STYLE),
                       style_str(failed_msg, ERROR_STYLE));

    sink_.write(out);
}

void PlainTextSerializer::on_error(std::string_view what) {
    if (!should_output_errors(verbosity_)) {
        return;
    }

    sink_.write(style_str(what, ERROR_STYLE) + "\n");
}

void PlainTextSerializer::finalize() {
    sink_.flush();
}

std::string PlainTextSerializer::kind_label(TestOutcomeKind kind) const {
    switch (kind) {
    case TestOutcomeKind::Passed:
        return style_str("PASSED", SUCCESS_STYLE);
    case TestOutcomeKind::FailedAssertion:
        return style_str("FAILED", ERROR_STYLE);
    case TestOutcomeKind::FailedWithException:
        return style_str("EXCEPTION", ERROR_STYLE);
    case TestOutcomeKind::FailedBySecurityViolation:
        return style_str("SECURITY", ERROR_STYLE);
    case TestOutcomeKind::FailedFromTimeout:
        return style_str("TIMEOUT", ERROR_STYLE);
    case TestOutcomeKind::CompileFailed:
        return style_str("COMPILE FAILED", ERROR_STYLE);
    case TestOutcomeKind::InternalError:
        return style_str("INTERNAL ERROR", WARNING_STYLE);
    }

    return fmt::format("{}", kind);
}

void PlainTextSerializer::write_stream(std::string_view label, const std::optional<std::string>& text) {
    if (!text || text->empty()) {
        return;
    }

    std::string out = fmt::format("  {}:\n{}", label, style_str(*text, VALUE_STYLE));

    if (!text->ends_with('\n')) {
        out += '\n';
    }

    sink_.write(out);
}

bool PlainTextSerializer::process_colorize_opt(ProgramOptions::ColorizeOpt colorize_option) {
    using enum ProgramOptions::ColorizeOpt;

    if (colorize_option == Never) {
        return false;
    }
    if (colorize_option == Always) {
        return true;
    }

    // Colorize if output is going to a color-supporting terminal, otherwise do not
    LOG_DEBUG("In terminal: {} & Color Supporting Terminal: {}", in_terminal(stdout), is_color_terminal());

    return in_terminal(stdout) && is_color_terminal();
}

std::string PlainTextSerializer::pluralize(std::string_view root, std::size_t count, std::string_view suffix) {
    if (count == 1) {
        return std::string{root};
    }

    return fmt::format("{}{}", root, suffix);
}

std::size_t PlainTextSerializer::get_terminal_width() {
    auto width = terminal_size(stdout).transform([](const winsize& size) { return std::size_t{size.ws_col}; });

    if (width.has_error()) {
        LOG_DEBUG("Could not obtain terminal width because {}. Defaulting to {}", width.error(), DEFAULT_WIDTH);
    }

    return width.value_or(DEFAULT_WIDTH);
}

} // namespace sandtest
