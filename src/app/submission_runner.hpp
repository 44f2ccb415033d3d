#pragma once

#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>
#include <sandtest/tester/tester.hpp>

#include "output/serializer.hpp"

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

namespace sandtest {

/// Tests one submission and reports each result through a serializer
class SubmissionRunner
{
public:
    SubmissionRunner(ITester& tester, std::shared_ptr<Serializer> serializer);

    /// Returns the results, in test case order (or the single submission-wide failure)
    std::vector<TestResult> run(const Problem& problem, std::span<const TestCase> test_cases,
                                std::string_view program_text, std::string_view submission_name) const;

    /// Number of results that did not pass
    static std::size_t num_failed(std::span<const TestResult> results);

private:
    ITester* tester_;
    std::shared_ptr<Serializer> serializer_;
};

} // namespace sandtest
