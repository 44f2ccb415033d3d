#include <sandtest/tester/result_aggregator.hpp>

#include <sandtest/logging.hpp>
#include <sandtest/model/test_result.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sandtest {

namespace {

std::string stream_for(const std::unordered_map<std::size_t, std::string>& by_index, std::size_t idx) {
    if (auto iter = by_index.find(idx); iter != by_index.end()) {
        return iter->second;
    }

    return "";
}

} // namespace

std::vector<TestResult> aggregate_results(std::vector<TestResult> outcomes,
                                          const std::unordered_map<std::size_t, std::string>& stdout_by_index,
                                          const std::unordered_map<std::size_t, std::string>& stderr_by_index) {
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        outcomes[i].captured_stdout = stream_for(stdout_by_index, i);
        outcomes[i].captured_stderr = stream_for(stderr_by_index, i);

        LOG_TRACE("Result #{}: {:?}", i, outcomes[i]);
    }

    return outcomes;
}

} // namespace sandtest
