#pragma once

#include <sandtest/common/expected.hpp>
#include <sandtest/common/formatters.hpp>
#include <sandtest/compiler/compiled_context.hpp>
#include <sandtest/compiler/diagnostic.hpp>
#include <sandtest/model/source_unit.hpp>

#include <fmt/format.h>

#include <chrono>
#include <span>
#include <string>
#include <vector>

namespace sandtest {

struct CompilerOptions
{
    /// `$CXX` when set and non-empty, otherwise "g++"
    static std::string default_executable();

    static std::vector<std::string> default_flags();

    std::string executable = default_executable();
    std::vector<std::string> flags = default_flags();
    std::chrono::milliseconds timeout = std::chrono::seconds{30};
};

struct CompileFailure
{
    /// Recognized diagnostics, in the order the compiler emitted them
    std::vector<CompileDiagnostic> diagnostics;

    /// All diagnostics as one block; the raw compiler output if none were recognized
    std::string message;

    /// The compiler could not be run to completion (missing executable, timeout, pipe or fork
    /// failure). The submission is not at fault.
    bool tool_failure = false;
};

/// Drives an external g++-compatible compiler over in-memory sources
class Compiler
{
public:
    explicit Compiler(CompilerOptions options = {});

    /// Compiles ``units`` (concatenated in order, each introduced by a `#line 1 "<unit_name>"`
    /// directive) into a shared object. No file is created on disk.
    Expected<CompiledContext, CompileFailure> compile(std::span<const SourceUnit> units) const;

    const CompilerOptions& get_options() const { return options_; }

    /// The text piped to the compiler for ``units``
    static std::string concatenate_units(std::span<const SourceUnit> units);

private:
    CompilerOptions options_;
};

} // namespace sandtest

template <>
struct fmt::formatter<::sandtest::CompileFailure> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::CompileFailure& from, format_context& ctx) const {
        if (from.tool_failure) {
            return fmt::format_to(ctx.out(), "compiler failure: {}", from.message);
        }
        return fmt::format_to(ctx.out(), "{} diagnostic(s):\n{}", from.diagnostics.size(), from.message);
    }
};
