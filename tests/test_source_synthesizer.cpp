#include "catch2_custom.hpp"

#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/synth/source_synthesizer.hpp>

#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;

namespace {

const sandtest::Problem SUM_PROBLEM{.test_name = "sum", .extra_includes = {"queue"}};

} // namespace

TEST_CASE("Subject unit wraps the submission verbatim") {
    const std::string submission = "int sum(int a, int b) { return a + b; }";

    auto unit = sandtest::synthesize_subject_unit(submission, SUM_PROBLEM);

    REQUIRE(unit.unit_name == "Test");
    REQUIRE_THAT(unit.source_text, StartsWith("#include <algorithm>\n"));
    REQUIRE_THAT(unit.source_text, ContainsSubstring("#include <string>\n"));
    REQUIRE_THAT(unit.source_text, ContainsSubstring("#include <vector>\n"));
    REQUIRE_THAT(unit.source_text, ContainsSubstring("#include <queue>\n"));
    REQUIRE_THAT(unit.source_text, EndsWith("struct Test\n{\n#line 1 \"Test\"\n" + submission + "\n};\n"));

    // Extra includes come after the defaults
    REQUIRE(unit.source_text.find("<queue>") > unit.source_text.find("<vector>"));
}

TEST_CASE("Submissions are not validated") {
    auto unit = sandtest::synthesize_subject_unit("this is { not C++", sandtest::Problem{.test_name = "f"});

    REQUIRE_THAT(unit.source_text, ContainsSubstring("this is { not C++"));
}

TEST_CASE("Format a single check routine") {
    sandtest::TestCase test_case{.name = "t1", .input = "2, 3", .output = "5"};

    REQUIRE(sandtest::format_check_routine(SUM_PROBLEM, test_case) ==
            "    static bool t1() { Test t; return eq(t.sum(2, 3), 5); }");
}

TEST_CASE("Check unit has one routine and one table entry per test case") {
    const std::vector<sandtest::TestCase> test_cases = {
        {.name = "first", .input = "1, 1", .output = "2"},
        {.name = "second", .input = "\"a\", 2", .output = "\"aa\""},
    };

    auto unit = sandtest::synthesize_check_unit(SUM_PROBLEM, test_cases);
    const std::string& text = unit.source_text;

    REQUIRE(unit.unit_name == "Tester");
    REQUIRE_THAT(text, ContainsSubstring("struct Tester\n{\n"));
    REQUIRE_THAT(text, ContainsSubstring("bool eq(const A& actual, const B& expected)"));
    REQUIRE_THAT(text, ContainsSubstring("std::strcmp(actual, expected) == 0"));

    REQUIRE_THAT(text, ContainsSubstring(sandtest::format_check_routine(SUM_PROBLEM, test_cases[0])));
    REQUIRE_THAT(text, ContainsSubstring(sandtest::format_check_routine(SUM_PROBLEM, test_cases[1])));

    REQUIRE_THAT(text, ContainsSubstring("extern \"C\" const SandtestCheckEntry Tester_checks[] = {\n"
                                         "    {\"first\", &Tester::first},\n"
                                         "    {\"second\", &Tester::second},\n"
                                         "    {nullptr, nullptr},\n"
                                         "};\n"));
}

TEST_CASE("Check unit for no test cases still has a terminated table") {
    auto unit = sandtest::synthesize_check_unit(SUM_PROBLEM, {});

    REQUIRE_THAT(unit.source_text, ContainsSubstring("extern \"C\" const SandtestCheckEntry Tester_checks[] = {\n"
                                                     "    {nullptr, nullptr},\n};"));
}
