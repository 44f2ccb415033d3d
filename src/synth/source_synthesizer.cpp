#include <sandtest/synth/source_synthesizer.hpp>

#include <sandtest/logging.hpp>
#include <sandtest/model/problem.hpp>
#include <sandtest/model/source_unit.hpp>
#include <sandtest/model/test_case.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/view/transform.hpp>

#include <array>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace sandtest {

namespace {

// Headers every subject unit gets, before Problem::extra_includes
constexpr std::array DEFAULT_INCLUDES = {
    "algorithm", "cmath",  "cstdint", "cstring", "iostream", "map",    "numeric",
    "set",       "sstream", "stdexcept", "string", "unordered_map", "utility", "vector",
};

// Comparison helpers shared by every check routine.
// Pointer results are dereferenced unconditionally, so a null result faults inside the routine.
constexpr std::string_view EQ_HELPERS = R"(namespace {

template <typename A, typename B>
bool eq(const A& actual, const B& expected) {
    return actual == expected;
}

template <typename A, typename B>
bool eq(A* actual, const B& expected) {
    return *actual == expected;
}

inline bool eq(const char* actual, const char* expected) {
    return std::strcmp(actual, expected) == 0;
}

} // namespace
)";

void append_include(std::string& out, std::string_view header) {
    fmt::format_to(std::back_inserter(out), "#include <{}>\n", header);
}

} // namespace

SourceUnit synthesize_subject_unit(std::string_view submission_text, const Problem& problem) {
    std::string text;

    for (const char* header : DEFAULT_INCLUDES) {
        append_include(text, header);
    }
    for (const std::string& header : problem.extra_includes) {
        append_include(text, header);
    }

    // The #line directive makes diagnostics refer to the submission's own line numbers
    fmt::format_to(std::back_inserter(text), "\nstruct {0}\n{{\n#line 1 \"{0}\"\n{1}\n}};\n", SUBJECT_UNIT_NAME,
                   submission_text);

    LOG_TRACE("Synthesized subject unit:\n{}", text);

    return {.unit_name = std::string{SUBJECT_UNIT_NAME}, .source_text = std::move(text)};
}

std::string format_check_routine(const Problem& problem, const TestCase& test_case) {
    return fmt::format("    static bool {}() {{ {} t; return eq(t.{}({}), {}); }}", test_case.name, SUBJECT_UNIT_NAME,
                       problem.test_name, test_case.input, test_case.output);
}

SourceUnit synthesize_check_unit(const Problem& problem, std::span<const TestCase> test_cases) {
    std::string text = "#include <cstring>\n\n";
    text += EQ_HELPERS;

    auto routines = test_cases | ranges::views::transform([&problem](const TestCase& test_case) {
                        return format_check_routine(problem, test_case);
                    });
    fmt::format_to(std::back_inserter(text), "\nstruct {}\n{{\n{}\n}};\n", CHECK_UNIT_NAME,
                   fmt::join(routines, "\n"));

    // Lookup table resolved by the host with dlsym; replaces runtime reflection over `Tester`
    text += "\nstruct SandtestCheckEntry\n{\n    const char* name;\n    bool (*routine)();\n};\n\n";
    fmt::format_to(std::back_inserter(text), "extern \"C\" const SandtestCheckEntry {}{}[] = {{\n", CHECK_UNIT_NAME,
                   CHECK_TABLE_SUFFIX);
    for (const TestCase& test_case : test_cases) {
        fmt::format_to(std::back_inserter(text), "    {{\"{0}\", &{1}::{0}}},\n", test_case.name, CHECK_UNIT_NAME);
    }
    text += "    {nullptr, nullptr},\n};\n";

    LOG_TRACE("Synthesized check unit:\n{}", text);

    return {.unit_name = std::string{CHECK_UNIT_NAME}, .source_text = std::move(text)};
}

} // namespace sandtest
