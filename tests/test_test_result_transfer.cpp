#include "catch2_custom.hpp"

#include <sandtest/common/error_types.hpp>
#include <sandtest/model/test_result.hpp>
#include <sandtest/tester/test_result_transfer.hpp>

#include <optional>
#include <string>

using sandtest::ErrorKind;
using sandtest::TestOutcomeKind;
using sandtest::TestResult;
using Transfer = sandtest::TaskTransfer<TestResult>;

TEST_CASE("Encode a TestResult") {
    TestResult result{.kind = TestOutcomeKind::FailedAssertion,
                      .message = "Failed for input=1, expected=2",
                      .captured_stdout = "not transferred",
                      .captured_stderr = std::nullopt};

    REQUIRE(Transfer::encode(result) == "1:Failed for input=1, expected=2");
}

TEST_CASE("Decode keeps colons and newlines in the message") {
    auto decoded = Transfer::decode("2:Failed with a: b\nc");

    REQUIRE(decoded);
    REQUIRE(decoded->kind == TestOutcomeKind::FailedWithException);
    REQUIRE(decoded->message == "Failed with a: b\nc");
    REQUIRE_FALSE(decoded->captured_stdout.has_value());
}

TEST_CASE("Decode an empty message") {
    auto decoded = Transfer::decode("0:");

    REQUIRE(decoded);
    REQUIRE(decoded->passed());
    REQUIRE(decoded->message.empty());
}

TEST_CASE("Malformed encodings are protocol violations") {
    REQUIRE(Transfer::decode("") == ErrorKind::ProtocolViolation);
    REQUIRE(Transfer::decode("no separator") == ErrorKind::ProtocolViolation);
    REQUIRE(Transfer::decode(":missing kind") == ErrorKind::ProtocolViolation);
    REQUIRE(Transfer::decode("x1:not a number") == ErrorKind::ProtocolViolation);
    REQUIRE(Transfer::decode("7:out of range") == ErrorKind::ProtocolViolation);
    REQUIRE(Transfer::decode("-1:negative") == ErrorKind::ProtocolViolation);
}
