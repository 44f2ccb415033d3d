#include "user/test_case_reader.hpp"

#include <sandtest/common/expected.hpp>
#include <sandtest/logging.hpp>
#include <sandtest/model/test_case.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sandtest {

namespace {

bool is_identifier(std::string_view name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front())) != 0) {
        return false;
    }

    return ranges::all_of(name, [](unsigned char chr) { return std::isalnum(chr) != 0 || chr == '_'; });
}

} // namespace

TestCaseReader::TestCaseReader(std::filesystem::path path)
    : path_{std::move(path)} {}

Expected<std::vector<TestCase>, std::string> TestCaseReader::read() const {
    auto contents = read_file_contents(path_);

    if (!contents) {
        return contents.error();
    }

    return parse(*contents);
}

Expected<std::vector<TestCase>, std::string> TestCaseReader::parse(std::string_view contents) {
    std::vector<TestCase> result;
    std::unordered_set<std::string> seen_names;

    std::istringstream in_stream{std::string{contents}};
    std::string line;
    std::size_t line_num = 0;

    while (std::getline(in_stream, line)) {
        ++line_num;

        // Remove a CR character; windows linefeed
        if (line.ends_with('\r')) {
            line.resize(line.size() - 1);
        }

        if (line.empty() || line.starts_with('#')) {
            LOG_TRACE("Skipping line {}", line_num);
            continue;
        }

        std::vector values = line | ranges::views::split('\t') | ranges::to<std::vector<std::string>>;

        if (values.size() != 3) {
            return fmt::format("Line {}: expected 3 tab-separated values (name, input, output), got {}", line_num,
                               values.size());
        }

        if (!is_identifier(values[0])) {
            return fmt::format("Line {}: test case name {:?} is not a valid identifier", line_num, values[0]);
        }

        if (!seen_names.insert(values[0]).second) {
            return fmt::format("Line {}: duplicate test case name {:?}", line_num, values[0]);
        }

        result.push_back(TestCase{.name = std::move(values[0]), .input = std::move(values[1]),
                                  .output = std::move(values[2])});
    }

    return result;
}

Expected<std::string, std::string> read_file_contents(const std::filesystem::path& path) {
    std::ifstream in_file{path};

    if (not in_file.is_open()) {
        return {unexpected, fmt::format("Failed to open {:?}", path.string())};
    }

    std::string contents{std::istreambuf_iterator<char>{in_file}, std::istreambuf_iterator<char>{}};

    if (in_file.bad()) {
        return {unexpected, fmt::format("IO error in reading {:?}", path.string())};
    }

    return contents;
}

} // namespace sandtest
