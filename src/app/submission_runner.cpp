#include "app/submission_runner.hpp"

#include <sandtest/logging.hpp>
#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>
#include <sandtest/tester/tester.hpp>

#include "output/serializer.hpp"

#include <range/v3/algorithm/count_if.hpp>
#include <range/v3/view/zip.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace sandtest {

SubmissionRunner::SubmissionRunner(ITester& tester, std::shared_ptr<Serializer> serializer)
    : tester_{&tester}
    , serializer_{std::move(serializer)} {}

std::vector<TestResult> SubmissionRunner::run(const Problem& problem, std::span<const TestCase> test_cases,
                                              std::string_view program_text, std::string_view submission_name) const {
    serializer_->on_submission_begin(problem, submission_name);

    std::vector<TestResult> results = DEBUG_TIME(tester_->test_submission(problem, test_cases, program_text));

    // A compile failure (or a failure to load the compiled unit) yields one result for the whole submission
    bool never_ran = results.size() != test_cases.size() ||
                     (results.size() == 1 && results.front().kind == TestOutcomeKind::CompileFailed);

    if (never_ran) {
        if (!results.empty()) {
            serializer_->on_submission_failure(results.front());
        }
    } else {
        for (const auto& [test_case, result] : ranges::views::zip(test_cases, results)) {
            serializer_->on_test_result(test_case, result);
        }
    }

    serializer_->on_summary(results);
    serializer_->finalize();

    LOG_DEBUG("{} of {} result(s) did not pass", num_failed(results), results.size());

    return results;
}

std::size_t SubmissionRunner::num_failed(std::span<const TestResult> results) {
    return static_cast<std::size_t>(ranges::count_if(results, [](const TestResult& res) { return !res.passed(); }));
}

} // namespace sandtest
