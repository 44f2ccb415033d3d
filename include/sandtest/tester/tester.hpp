#pragma once

#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace sandtest {

/// Tests one submission against a problem's test cases
class ITester
{
public:
    virtual ~ITester() = default;

    /// Returns one result per test case, in order. If the submission does not compile, returns a
    /// single CompileFailed result instead and no test case is run.
    virtual std::vector<TestResult> test_submission(const Problem& problem, std::span<const TestCase> test_cases,
                                                    std::string_view program_text) = 0;
};

} // namespace sandtest
