#include <sandtest/tester/test_result_transfer.hpp>

#include <sandtest/common/error_types.hpp>
#include <sandtest/logging.hpp>
#include <sandtest/model/test_result.hpp>

#include <fmt/format.h>

#include <charconv>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace sandtest {

std::string TaskTransfer<TestResult>::encode(const TestResult& result) {
    return fmt::format("{}:{}", fmt::underlying(result.kind), result.message);
}

Result<TestResult> TaskTransfer<TestResult>::decode(std::string_view encoded) {
    std::size_t sep = encoded.find(':');

    if (sep == std::string_view::npos || sep == 0) {
        LOG_DEBUG("Encoded TestResult has no kind prefix: {:?}", encoded);
        return ErrorKind::ProtocolViolation;
    }

    int kind_num{};
    std::string_view kind_str = encoded.substr(0, sep);
    auto [ptr, ec] = std::from_chars(kind_str.data(), kind_str.data() + kind_str.size(), kind_num);

    if (ec != std::errc{} || ptr != kind_str.data() + kind_str.size()) {
        LOG_DEBUG("Encoded TestResult has a malformed kind: {:?}", kind_str);
        return ErrorKind::ProtocolViolation;
    }

    if (kind_num < static_cast<int>(TestOutcomeKind::Passed) ||
        kind_num > static_cast<int>(TestOutcomeKind::InternalError)) {
        LOG_DEBUG("Encoded TestResult kind out of range: {}", kind_num);
        return ErrorKind::ProtocolViolation;
    }

    return TestResult{.kind = static_cast<TestOutcomeKind>(kind_num),
                      .message = std::string{encoded.substr(sep + 1)},
                      .captured_stdout = std::nullopt,
                      .captured_stderr = std::nullopt};
}

} // namespace sandtest
