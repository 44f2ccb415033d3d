#pragma once

#include <sandtest/common/formatters.hpp>

#include <fmt/format.h>

#include <string>

namespace sandtest {

/// One check against a submission.
///
/// `input` and `output` are C++ expressions that are pasted into generated source as-is.
/// `name` must be a legal C++ identifier and unique within a request.
struct TestCase
{
    std::string name;
    std::string input;
    std::string output;

    bool operator==(const TestCase& rhs) const = default;
};

} // namespace sandtest

template <>
struct fmt::formatter<::sandtest::TestCase> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::TestCase& from, format_context& ctx) const {
        if (is_debug_format) {
            return fmt::format_to(ctx.out(), "TestCase{{name={:?}, input={:?}, output={:?}}}", from.name, from.input,
                                  from.output);
        }
        return fmt::format_to(ctx.out(), "{}({}) == {}", from.name, from.input, from.output);
    }
};
