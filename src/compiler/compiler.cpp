#include <sandtest/compiler/compiler.hpp>

#include "subprocess/run_result.hpp"
#include "subprocess/subprocess.hpp"

#include <sandtest/common/expected.hpp>
#include <sandtest/common/linux.hpp>
#include <sandtest/compiler/compiled_context.hpp>
#include <sandtest/compiler/diagnostic.hpp>
#include <sandtest/logging.hpp>
#include <sandtest/model/source_unit.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <sys/mman.h>

namespace sandtest {

namespace {

/// Exit status of a child whose exec failed, see Subprocess
constexpr int EXEC_FAILURE_EXIT_CODE = 127;

CompileFailure make_tool_failure(std::string message) {
    LOG_ERROR("Compiler tool failure: {}", message);
    return CompileFailure{.diagnostics = {}, .message = std::move(message), .tool_failure = true};
}

} // namespace

std::string CompilerOptions::default_executable() {
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char* env_cxx = std::getenv("CXX");

    if (env_cxx != nullptr && *env_cxx != '\0') {
        return env_cxx;
    }

    return "g++";
}

std::vector<std::string> CompilerOptions::default_flags() {
    // -fno-gnu-unique: otherwise the loader may keep handing back an earlier unit with the
    // same soname instead of loading ours
    return {"-std=c++20", "-O0", "-fPIC", "-shared", "-fno-gnu-unique", "-fdiagnostics-plain-output"};
}

Compiler::Compiler(CompilerOptions options)
    : options_{std::move(options)} {}

std::string Compiler::concatenate_units(std::span<const SourceUnit> units) {
    std::string result;

    for (const SourceUnit& unit : units) {
        result += fmt::format("#line 1 \"{}\"\n", unit.unit_name);
        result += unit.source_text;

        if (!result.ends_with('\n')) {
            result += '\n';
        }
    }

    return result;
}

Expected<CompiledContext, CompileFailure> Compiler::compile(std::span<const SourceUnit> units) const {
    const std::string source = concatenate_units(units);

    LOG_TRACE("Compiling source:\n{}", source);

    auto memfd = linux::memfd_create("sandtest-unit", MFD_CLOEXEC);
    if (!memfd) {
        return make_tool_failure(fmt::format("could not create in-memory output file: {}", memfd.error()));
    }

    CompiledContext context{memfd.value()};

    // The compiler is a separate process, so it must reach our descriptor through our pid
    auto self = linux::getpid();
    if (!self) {
        return make_tool_failure(fmt::format("could not determine own pid: {}", self.error()));
    }

    std::vector<std::string> args = options_.flags;
    args.insert(args.end(), {"-x", "c++", "-", "-o", fmt::format("/proc/{}/fd/{}", self.value(), memfd.value())});

    LOG_DEBUG("Running {} {}", options_.executable, fmt::join(args, " "));

    Subprocess compiler_proc{options_.executable, std::move(args)};

    if (auto res = compiler_proc.start(); !res) {
        return make_tool_failure(fmt::format("could not start {}: {}", options_.executable, res.error()));
    }

    auto run_res = DEBUG_TIME(compiler_proc.communicate(source, options_.timeout));

    if (!run_res) {
        if (run_res.error() == ErrorKind::TimedOut) {
            return make_tool_failure(
                fmt::format("{} did not finish within {}", options_.executable, options_.timeout));
        }
        return make_tool_failure(fmt::format("error communicating with {}: {}", options_.executable, run_res.error()));
    }

    const std::string output = compiler_proc.get_stderr() + compiler_proc.get_stdout();

    if (run_res->get_kind() == RunResult::Kind::Killed) {
        return make_tool_failure(fmt::format("{} was killed by {}", options_.executable,
                                             linux::Signal{run_res->get_code()}));
    }

    if (run_res->get_code() == EXEC_FAILURE_EXIT_CODE && output.empty()) {
        return make_tool_failure(fmt::format("could not execute {}", options_.executable));
    }

    if (run_res->get_code() != 0) {
        std::vector<CompileDiagnostic> diagnostics = parse_diagnostics(output);
        std::string message = join_diagnostics(diagnostics, output);

        if (message.empty()) {
            message = fmt::format("{} exited with status {}", options_.executable, run_res->get_code());
        }

        LOG_DEBUG("Compilation failed with {} diagnostic(s)", diagnostics.size());

        return CompileFailure{
            .diagnostics = std::move(diagnostics), .message = std::move(message), .tool_failure = false};
    }

    if (!output.empty()) {
        LOG_DEBUG("Compiler output on success:\n{}", output);
    }

    return std::move(context);
}

} // namespace sandtest
