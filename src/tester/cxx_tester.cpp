#include <sandtest/tester/cxx_tester.hpp>

#include <sandtest/common/linux.hpp>
#include <sandtest/compiler/compiled_context.hpp>
#include <sandtest/compiler/compiler.hpp>
#include <sandtest/logging.hpp>
#include <sandtest/model/source_unit.hpp>
#include <sandtest/model/test_result.hpp>
#include <sandtest/sandbox/capability_policy.hpp>
#include <sandtest/sandbox/killable_task_manager.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>
#include <sandtest/synth/source_synthesizer.hpp>
#include <sandtest/tester/result_aggregator.hpp>
#include <sandtest/tester/test_result_transfer.hpp>

#include <fmt/format.h>

#include <array>
#include <exception>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sandtest {

namespace {

TestResult make_result(TestOutcomeKind kind, std::string message) {
    return TestResult{
        .kind = kind, .message = std::move(message), .captured_stdout = std::nullopt, .captured_stderr = std::nullopt};
}

constexpr std::string_view TIMEOUT_MESSAGE =
    "Took too long!  Check for infinite loops, or recursion without a proper base case";

} // namespace

CxxTester::CxxTester(TesterOptions options)
    : options_{std::move(options)}
    , policy_{&CapabilityPolicy::install(options_.policy)} {}

std::vector<TestResult> CxxTester::test_submission(const Problem& problem, std::span<const TestCase> test_cases,
                                                   std::string_view program_text) {
    LOG_DEBUG("Testing submission for {:?} against {} test case(s) ({} syscalls denied)", problem.test_name,
              test_cases.size(), policy_->num_denied());

    std::array units = {synthesize_subject_unit(program_text, problem),
                        synthesize_check_unit(problem, test_cases)};

    Compiler compiler{options_.compiler};
    auto compiled = compiler.compile(units);

    if (!compiled) {
        const CompileFailure& failure = compiled.error();

        if (failure.tool_failure) {
            LOG_ERROR("Could not run the compiler: {}", failure.message);
            return {make_result(TestOutcomeKind::InternalError, fmt::format("Compiler failure: {}", failure.message))};
        }

        LOG_DEBUG("Submission failed to compile: {}", failure);
        return {make_result(TestOutcomeKind::CompileFailed, failure.message)};
    }

    auto container = compiled->load_container(CHECK_UNIT_NAME);

    if (!container) {
        LOG_ERROR("Could not load the check table: {}", container.error());
        return {make_result(TestOutcomeKind::InternalError,
                            fmt::format("Class not found exception: {}", container.error()))};
    }

    const CheckContainer& checks = container.value();

    std::vector<SandboxTask<TestResult>> tasks;
    tasks.reserve(test_cases.size());

    for (const TestCase& test_case : test_cases) {
        tasks.emplace_back([&checks, &test_case] { return run_check(checks, test_case); });
    }

    auto on_timeout = [] { return make_result(TestOutcomeKind::FailedFromTimeout, std::string{TIMEOUT_MESSAGE}); };
    auto on_worker_fault = [this, program_text](const WorkerFault& fault) { return on_fault(fault, program_text); };

    KillableTaskManager<TestResult> manager{std::move(tasks), options_.timeout, on_timeout, on_worker_fault,
                                            options_.executor};

    manager.run();

    return aggregate_results(manager.get_outcomes(), manager.get_buffered_stdout(), manager.get_buffered_stderr());
}

TestResult CxxTester::run_check(const CheckContainer& container, const TestCase& test_case) {
    if (!container.contains(test_case.name)) {
        return make_result(TestOutcomeKind::InternalError, "Method not found while testing submission");
    }

    CheckRoutine routine = container.find(test_case.name);

    if (routine == nullptr) {
        return make_result(TestOutcomeKind::InternalError, "Illegal access while testing submission");
    }

    try {
        if (routine()) {
            return make_result(TestOutcomeKind::Passed,
                               fmt::format("Passed! input={}, output={}", test_case.input, test_case.output));
        }
        return make_result(TestOutcomeKind::FailedAssertion,
                           fmt::format("Failed for input={}, expected={}", test_case.input, test_case.output));
    } catch (const std::exception& ex) {
        return make_result(TestOutcomeKind::FailedWithException, fmt::format("Failed with {}", ex.what()));
    } catch (...) {
        return make_result(TestOutcomeKind::FailedWithException,
                           "Failed with <unknown - not derived from std::exception>");
    }
}

TestResult CxxTester::on_fault(const WorkerFault& fault, std::string_view program_text) const {
    switch (fault.kind) {
    case WorkerFault::Kind::SecurityViolation:
        LOG_WARN("Security exception ({}) with code: {}", fault.detail, program_text);
        return make_result(TestOutcomeKind::FailedBySecurityViolation, "Security exception while testing submission");

    case WorkerFault::Kind::Signaled:
        if (fault.signal_num) {
            return make_result(TestOutcomeKind::FailedWithException,
                               fmt::format("Failed with signal {}", linux::Signal{*fault.signal_num}));
        }
        return make_result(TestOutcomeKind::FailedWithException, fmt::format("Failed with {}", fault.detail));

    case WorkerFault::Kind::UncaughtException:
    case WorkerFault::Kind::NoResult:
    case WorkerFault::Kind::CorruptResult:
    case WorkerFault::Kind::SpawnFailed:
        break;
    }

    LOG_ERROR("Internal error while testing submission: {}", fault);
    return make_result(TestOutcomeKind::InternalError,
                       fmt::format("Internal error while testing submission: {}", fault));
}

} // namespace sandtest
