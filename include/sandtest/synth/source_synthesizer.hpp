#pragma once

#include <sandtest/model/problem.hpp>
#include <sandtest/model/source_unit.hpp>
#include <sandtest/model/test_case.hpp>

#include <span>
#include <string>
#include <string_view>

namespace sandtest {

/// Name of the struct (and unit) that wraps the submission
inline constexpr std::string_view SUBJECT_UNIT_NAME = "Test";

/// Name of the struct (and unit) that holds the generated check routines
inline constexpr std::string_view CHECK_UNIT_NAME = "Tester";

/// Suffix of the extern "C" lookup table emitted into the check unit, i.e. `Tester_checks`
inline constexpr std::string_view CHECK_TABLE_SUFFIX = "_checks";

/// Wraps ``submission_text`` verbatim in `struct Test { ... };`, preceded by the default
/// standard headers and ``problem.extra_includes``.
/// No validation is performed; malformed submissions surface as compile diagnostics.
SourceUnit synthesize_subject_unit(std::string_view submission_text, const Problem& problem);

/// Generates `struct Tester` with one static check routine per test case, the shared `eq`
/// comparison helpers, and the `Tester_checks` lookup table.
SourceUnit synthesize_check_unit(const Problem& problem, std::span<const TestCase> test_cases);

/// Renders the single check routine for ``test_case``, e.g.
///   static bool t1() { Test t; return eq(t.sum(2, 3), 5); }
std::string format_check_routine(const Problem& problem, const TestCase& test_case);

} // namespace sandtest
