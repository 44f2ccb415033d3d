#pragma once

#include <sandtest/common/formatters.hpp>

#include <fmt/format.h>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sandtest {

enum class DiagnosticSeverity { Note, Warning, Error, Fatal };

/// Where a diagnostic points. ``unit`` is the unit name given by the #line directive
struct SourceLocation
{
    std::string unit;
    int line{};
    std::optional<int> column;

    bool operator==(const SourceLocation& rhs) const = default;
};

/// A single compiler message, possibly spanning several lines of output
struct CompileDiagnostic
{
    DiagnosticSeverity severity;
    SourceLocation location;
    std::string message;

    bool operator==(const CompileDiagnostic& rhs) const = default;
};

/// The spelling of ``severity`` used by gcc, e.g. "fatal error"
std::string_view to_string(DiagnosticSeverity severity);

/// Parses compiler output made of lines like `unit:line[:column]: severity: message`.
///
/// Lines that do not match are appended to the preceding diagnostic's message (e.g. "compilation
/// terminated."), except context headers ending in ':' such as "Test: In member function ...",
/// which are dropped, as is anything before the first diagnostic.
std::vector<CompileDiagnostic> parse_diagnostics(std::string_view compiler_output);

/// Joins formatted ``diagnostics`` with '\n', without a trailing separator.
/// Falls back to the trimmed ``raw_output`` when no diagnostic was recognized.
std::string join_diagnostics(std::span<const CompileDiagnostic> diagnostics, std::string_view raw_output);

} // namespace sandtest

template <>
struct fmt::formatter<::sandtest::DiagnosticSeverity> : formatter<std::string_view>
{
    auto format(::sandtest::DiagnosticSeverity from, format_context& ctx) const {
        return formatter<std::string_view>::format(::sandtest::to_string(from), ctx);
    }
};

template <>
struct fmt::formatter<::sandtest::SourceLocation> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::SourceLocation& from, format_context& ctx) const {
        if (from.column) {
            return fmt::format_to(ctx.out(), "{}:{}:{}", from.unit, from.line, *from.column);
        }
        return fmt::format_to(ctx.out(), "{}:{}", from.unit, from.line);
    }
};

template <>
struct fmt::formatter<::sandtest::CompileDiagnostic> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::CompileDiagnostic& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}: {}: {}", from.location, from.severity, from.message);
    }
};
