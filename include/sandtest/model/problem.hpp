#pragma once

#include <string>
#include <vector>

namespace sandtest {

/// The method under test, plus any headers the submission needs beyond the default set
struct Problem
{
    /// Name of the member function of `Test` that every check routine calls
    std::string test_name;

    /// Header names as they would appear between angle brackets, e.g. "map" or "numeric"
    std::vector<std::string> extra_includes;

    bool operator==(const Problem& rhs) const = default;
};

} // namespace sandtest
