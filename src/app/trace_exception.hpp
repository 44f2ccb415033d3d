#pragma once

#include <sandtest/common/formatters.hpp> // IWYU pragma: keep

#include <boost/stacktrace/stacktrace.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <cstdio>
#include <string>

namespace sandtest {

/// Reports an exception that escaped to the top level, along with the current stacktrace
template <typename T>
void trace_exception(const T& exception) {
    boost::stacktrace::stacktrace trace;
    std::string except_str = fmt::format("Unhandled exception: {}", exception);
    fmt::print(stderr, "{}\n", except_str);
    fmt::print(stderr, "{}\n", std::string(except_str.size(), '='));

    std::string stacktrace_str = fmt::to_string(fmt::streamed(trace));
    fmt::print(stderr, "Stacktrace:\n{}\n", stacktrace_str.empty() ? " <unavailable>" : stacktrace_str);
}

} // namespace sandtest
