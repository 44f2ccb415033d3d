#include "catch2_custom.hpp"

#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>
#include <sandtest/tester/cxx_tester.hpp>

#include <chrono>
#include <string>
#include <vector>

using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using sandtest::TestOutcomeKind;

namespace {

const sandtest::Problem SUM_PROBLEM{.test_name = "sum", .extra_includes = {}};

const std::vector<sandtest::TestCase> SUM_CASES = {
    {.name = "small", .input = "2, 3", .output = "5"},
    {.name = "negative", .input = "-4, 1", .output = "-3"},
    {.name = "zero", .input = "0, 0", .output = "0"},
};

sandtest::TesterOptions quick_options() {
    sandtest::TesterOptions options;
    options.timeout = std::chrono::milliseconds{1000};
    return options;
}

} // namespace

TEST_CASE("Correct submission passes every test case") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, "int sum(int a, int b) { return a + b; }");

    REQUIRE(results.size() == SUM_CASES.size());

    for (const auto& result : results) {
        REQUIRE(result.passed());
        REQUIRE(result.captured_stdout == "");
        REQUIRE(result.captured_stderr == "");
    }

    REQUIRE(results[0].message == "Passed! input=2, 3, output=5");
}

TEST_CASE("Wrong answers fail their assertion only") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, "int sum(int a, int b) { return a > 0 ? a + b : 1; }");

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].passed());
    REQUIRE(results[1].kind == TestOutcomeKind::FailedAssertion);
    REQUIRE(results[1].message == "Failed for input=-4, 1, expected=-3");
    REQUIRE(results[2].kind == TestOutcomeKind::FailedAssertion);
}

TEST_CASE("A submission that does not compile yields a single result") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, "int sum(int a, int b) { return a + ; }");

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].kind == TestOutcomeKind::CompileFailed);
    REQUIRE_THAT(results[0].message, ContainsSubstring("Test:1"));
    REQUIRE_THAT(results[0].message, ContainsSubstring("error"));
}

TEST_CASE("Calling a missing method is a compile failure") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, "int add(int a, int b) { return a + b; }");

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].kind == TestOutcomeKind::CompileFailed);
}

TEST_CASE("Infinite loop times out without affecting other test cases") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, R"(
int sum(int a, int b) {
    volatile int spin = 0;
    while (a < 0) { ++spin; }
    return a + b;
})");

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].passed());
    REQUIRE(results[1].kind == TestOutcomeKind::FailedFromTimeout);
    REQUIRE_THAT(results[1].message, StartsWith("Took too long!"));
    REQUIRE(results[2].passed());
}

TEST_CASE("Exiting the process is a security violation") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, R"(
int sum(int a, int b) {
    if (a == 0) { std::exit(0); }
    return a + b;
})");

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].passed());
    REQUIRE(results[1].passed());
    REQUIRE(results[2].kind == TestOutcomeKind::FailedBySecurityViolation);
    REQUIRE(results[2].message == "Security exception while testing submission");
}

TEST_CASE("Forging a passing result is a security violation") {
    sandtest::CxxTester tester{quick_options()};
    sandtest::Problem problem{.test_name = "sum", .extra_includes = {"unistd.h"}};

    auto results = tester.test_submission(problem, SUM_CASES, R"(
int sum(int a, int b) {
    if (a == 0) {
        write(3, "R0:forged", 9);
        while (true) { pause(); }
    }
    return a + b + 1;
})");

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].kind == TestOutcomeKind::FailedAssertion);
    REQUIRE(results[1].kind == TestOutcomeKind::FailedAssertion);
    REQUIRE(results[2].kind == TestOutcomeKind::FailedBySecurityViolation);
}

TEST_CASE("Starting a thread is a security violation") {
    sandtest::CxxTester tester{quick_options()};
    sandtest::Problem problem{.test_name = "sum", .extra_includes = {"thread"}};

    auto results = tester.test_submission(problem, SUM_CASES, R"(
int sum(int a, int b) {
    int total = a + b;
    if (a == 0) {
        std::thread worker{[&total] { total = 0; }};
        worker.join();
    }
    return total;
})");

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].passed());
    REQUIRE(results[1].passed());
    REQUIRE(results[2].kind == TestOutcomeKind::FailedBySecurityViolation);
    REQUIRE(results[2].message == "Security exception while testing submission");
}

TEST_CASE("Exceptions and crashes fail only their test case") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, R"(
int* sum(int a, int b) {
    static int value;
    if (a < 0) { throw std::runtime_error("boom"); }
    if (a == 0) { return nullptr; }
    value = a + b;
    return &value;
})");

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].passed());
    REQUIRE(results[1].kind == TestOutcomeKind::FailedWithException);
    REQUIRE(results[1].message == "Failed with boom");
    REQUIRE(results[2].kind == TestOutcomeKind::FailedWithException);
    REQUIRE_THAT(results[2].message, ContainsSubstring("SIGSEGV"));
}

TEST_CASE("Output is captured per test case") {
    sandtest::CxxTester tester{quick_options()};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, R"(
int sum(int a, int b) {
    std::cout << "sum of " << a << " and " << b << std::endl;
    if (a < 0) { std::cerr << "negative!\n"; }
    return a + b;
})");

    REQUIRE(results.size() == 3);
    REQUIRE(results[0].passed());
    REQUIRE(results[0].captured_stdout == "sum of 2 and 3\n");
    REQUIRE(results[0].captured_stderr == "");
    REQUIRE(results[1].captured_stdout == "sum of -4 and 1\n");
    REQUIRE(results[1].captured_stderr == "negative!\n");
}

TEST_CASE("Extra includes are available to the submission") {
    sandtest::CxxTester tester{quick_options()};
    sandtest::Problem problem{.test_name = "largest", .extra_includes = {"queue"}};
    std::vector<sandtest::TestCase> cases = {{.name = "three", .input = "std::vector<int>{3, 9, 4}", .output = "9"}};

    auto results = tester.test_submission(problem, cases, R"(
int largest(const std::vector<int>& values) {
    std::priority_queue<int> queue(values.begin(), values.end());
    return queue.top();
})");

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].passed());
}

TEST_CASE("Missing compiler is an internal error") {
    sandtest::TesterOptions options = quick_options();
    options.compiler.executable = "/nonexistent/sandtest-g++";
    sandtest::CxxTester tester{options};

    auto results = tester.test_submission(SUM_PROBLEM, SUM_CASES, "int sum(int a, int b) { return a + b; }");

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].kind == TestOutcomeKind::InternalError);
    REQUIRE_THAT(results[0].message, StartsWith("Compiler failure: "));
}

TEST_CASE("Run a check routine directly") {
    // An empty container: the routine was never generated
    sandtest::CheckContainer empty;
    auto result = sandtest::CxxTester::run_check(empty, {.name = "t1", .input = "1", .output = "1"});

    REQUIRE(result.kind == TestOutcomeKind::InternalError);
    REQUIRE(result.message == "Method not found while testing submission");
}
