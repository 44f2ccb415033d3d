#include "catch2_custom.hpp"

#include <sandtest/model/test_result.hpp>
#include <sandtest/tester/result_aggregator.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using sandtest::TestOutcomeKind;
using sandtest::TestResult;

namespace {

TestResult make(TestOutcomeKind kind, std::string message) {
    return TestResult{
        .kind = kind, .message = std::move(message), .captured_stdout = std::nullopt, .captured_stderr = std::nullopt};
}

} // namespace

TEST_CASE("Streams are attached by index") {
    std::vector<TestResult> outcomes = {make(TestOutcomeKind::Passed, "a"), make(TestOutcomeKind::FailedAssertion, "b"),
                                        make(TestOutcomeKind::FailedFromTimeout, "c")};

    std::unordered_map<std::size_t, std::string> out = {{0, "hi"}, {2, "partial"}};
    std::unordered_map<std::size_t, std::string> err = {{1, "warning\n"}};

    auto results = sandtest::aggregate_results(outcomes, out, err);

    REQUIRE(results.size() == 3);

    // Order and outcomes are untouched
    REQUIRE(results[0].message == "a");
    REQUIRE(results[1].kind == TestOutcomeKind::FailedAssertion);
    REQUIRE(results[2].message == "c");

    REQUIRE(results[0].captured_stdout == "hi");
    REQUIRE(results[0].captured_stderr == "");
    REQUIRE(results[1].captured_stdout == "");
    REQUIRE(results[1].captured_stderr == "warning\n");
    REQUIRE(results[2].captured_stdout == "partial");
}

TEST_CASE("Aggregating nothing yields nothing") {
    REQUIRE(sandtest::aggregate_results({}, {}, {}).empty());
}
