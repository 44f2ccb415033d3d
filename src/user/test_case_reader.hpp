#pragma once

#include <sandtest/common/expected.hpp>
#include <sandtest/model/test_case.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sandtest {

/// Small reader for test case files
/// Expects the specified file to contain newline-separated "name<TAB>input<TAB>output" entries.
/// Blank lines and lines starting with '#' are skipped
class TestCaseReader
{
public:
    explicit TestCaseReader(std::filesystem::path path);

    Expected<std::vector<TestCase>, std::string> read() const;

    /// Parses the contents of a test case file. Errors name the offending line
    static Expected<std::vector<TestCase>, std::string> parse(std::string_view contents);

private:
    std::filesystem::path path_;
};

/// Reads an entire file, e.g. a submission
Expected<std::string, std::string> read_file_contents(const std::filesystem::path& path);

} // namespace sandtest
