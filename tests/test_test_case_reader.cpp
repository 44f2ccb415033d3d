#include "catch2_custom.hpp"

#include "user/test_case_reader.hpp"

#include <filesystem>
#include <string>

using sandtest::TestCaseReader;

TEST_CASE("Parse a small test case file") {
    auto res = TestCaseReader::parse("# name\tinput\toutput\n"
                                     "t1\t2, 3\t5\n"
                                     "\n"
                                     "t2\t\"ab\", 2\t\"abab\"\r\n"
                                     "t3\t-1, 1\t0");

    REQUIRE(res);
    REQUIRE(res->size() == 3);

    REQUIRE(res->at(0) == sandtest::TestCase{.name = "t1", .input = "2, 3", .output = "5"});
    REQUIRE(res->at(1) == sandtest::TestCase{.name = "t2", .input = "\"ab\", 2", .output = "\"abab\""});
    REQUIRE(res->at(2).name == "t3");
}

TEST_CASE("Wrong number of fields is an error") {
    auto res = TestCaseReader::parse("t1\t2, 3\n");

    REQUIRE_FALSE(res);
    REQUIRE_THAT(res.error(), Catch::Matchers::StartsWith("Line 1"));

    REQUIRE_FALSE(TestCaseReader::parse("ok\t1\t1\nt2\ta\tb\tc\n"));
}

TEST_CASE("Names must be unique identifiers") {
    REQUIRE_FALSE(TestCaseReader::parse("1bad\t1\t1\n"));
    REQUIRE_FALSE(TestCaseReader::parse("has space\t1\t1\n"));
    REQUIRE_FALSE(TestCaseReader::parse("dup\t1\t1\ndup\t2\t2\n"));
    REQUIRE(TestCaseReader::parse("_ok_2\t1\t1\n"));
}

TEST_CASE("Read a non-existent test case file; ensure error") {
    TestCaseReader reader{std::filesystem::path{"/nonexistent/sandtest-tests.tsv"}};

    REQUIRE_FALSE(reader.read());
    REQUIRE_FALSE(sandtest::read_file_contents("/nonexistent/submission.cpp"));
}
