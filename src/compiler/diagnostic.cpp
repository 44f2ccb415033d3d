#include <sandtest/compiler/diagnostic.hpp>

#include <sandtest/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/split.hpp>

#include <array>
#include <charconv>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace sandtest {

namespace {

struct SeverityMarker
{
    std::string_view marker;
    DiagnosticSeverity severity;
};

// "fatal error" must be checked before "error", as both may match
constexpr std::array SEVERITY_MARKERS = {
    SeverityMarker{": fatal error: ", DiagnosticSeverity::Fatal},
    SeverityMarker{": error: ", DiagnosticSeverity::Error},
    SeverityMarker{": warning: ", DiagnosticSeverity::Warning},
    SeverityMarker{": note: ", DiagnosticSeverity::Note},
};

std::optional<int> parse_int(std::string_view str) {
    int value{};
    const auto* end = str.data() + str.size();
    auto [ptr, ec] = std::from_chars(str.data(), end, value);

    if (str.empty() || ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }

    return value;
}

/// Splits off the last `:<int>` of ``str``
std::optional<std::pair<std::string_view, int>> split_trailing_number(std::string_view str) {
    auto colon = str.rfind(':');

    if (colon == std::string_view::npos) {
        return std::nullopt;
    }

    auto number = parse_int(str.substr(colon + 1));

    if (!number) {
        return std::nullopt;
    }

    return std::pair{str.substr(0, colon), *number};
}

/// `unit:line` or `unit:line:column`
std::optional<SourceLocation> parse_location(std::string_view str) {
    auto last = split_trailing_number(str);

    if (!last) {
        return std::nullopt;
    }

    SourceLocation location;

    if (auto second_last = split_trailing_number(last->first); second_last && !second_last->first.empty()) {
        location = {.unit = std::string{second_last->first}, .line = second_last->second, .column = last->second};
    } else {
        location = {.unit = std::string{last->first}, .line = last->second, .column = std::nullopt};
    }

    if (location.unit.empty()) {
        return std::nullopt;
    }

    return location;
}

std::optional<CompileDiagnostic> parse_diagnostic_line(std::string_view line) {
    const SeverityMarker* found = nullptr;
    std::size_t found_pos = std::string_view::npos;

    for (const SeverityMarker& marker : SEVERITY_MARKERS) {
        auto pos = line.find(marker.marker);
        if (pos < found_pos) {
            found = &marker;
            found_pos = pos;
        }
    }

    if (found == nullptr) {
        return std::nullopt;
    }

    auto location = parse_location(line.substr(0, found_pos));

    if (!location) {
        return std::nullopt;
    }

    return CompileDiagnostic{.severity = found->severity,
                             .location = std::move(*location),
                             .message = std::string{line.substr(found_pos + found->marker.size())}};
}

// gcc prints headers such as "Test: In member function 'int Test::f()':" and
// "In file included from Test:3:" ahead of the diagnostics they give context for
bool is_context_line(std::string_view line) {
    return line.ends_with(':');
}

std::string_view trim_trailing_whitespace(std::string_view str) {
    auto last = str.find_last_not_of(" \t\r\n");

    if (last == std::string_view::npos) {
        return {};
    }

    return str.substr(0, last + 1);
}

} // namespace

std::string_view to_string(DiagnosticSeverity severity) {
    switch (severity) {
    case DiagnosticSeverity::Note:
        return "note";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Fatal:
        return "fatal error";
    }

    return "<unknown severity>";
}

std::vector<CompileDiagnostic> parse_diagnostics(std::string_view compiler_output) {
    std::vector<CompileDiagnostic> result;

    std::vector lines = compiler_output | ranges::views::split('\n') | ranges::to<std::vector<std::string>>;

    for (std::string& line : lines) {
        if (line.ends_with('\r')) {
            line.resize(line.size() - 1);
        }

        if (trim_trailing_whitespace(line).empty()) {
            continue;
        }

        if (auto diagnostic = parse_diagnostic_line(line)) {
            result.push_back(std::move(*diagnostic));
            continue;
        }

        if (is_context_line(line) || result.empty()) {
            LOG_TRACE("Dropping compiler output line: {:?}", line);
            continue;
        }

        result.back().message += '\n';
        result.back().message += line;
    }

    return result;
}

std::string join_diagnostics(std::span<const CompileDiagnostic> diagnostics, std::string_view raw_output) {
    if (diagnostics.empty()) {
        return std::string{trim_trailing_whitespace(raw_output)};
    }

    std::string joined = fmt::format("{}", fmt::join(diagnostics, "\n"));

    return std::string{trim_trailing_whitespace(joined)};
}

} // namespace sandtest
