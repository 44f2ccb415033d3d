#pragma once

#include <sandtest/model/test_result.hpp>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandtest {

/// Attaches each slot's buffered streams to its outcome. outcomes[i] receives
/// stdout_by_index[i] and stderr_by_index[i]; a slot missing from a map gets an empty string.
std::vector<TestResult> aggregate_results(std::vector<TestResult> outcomes,
                                          const std::unordered_map<std::size_t, std::string>& stdout_by_index,
                                          const std::unordered_map<std::size_t, std::string>& stderr_by_index);

} // namespace sandtest
