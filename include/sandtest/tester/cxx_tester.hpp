#pragma once

#include <sandtest/compiler/compiled_context.hpp>
#include <sandtest/compiler/compiler.hpp>
#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>
#include <sandtest/sandbox/capability_policy.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>
#include <sandtest/tester/tester.hpp>

#include <chrono>
#include <span>
#include <string_view>
#include <vector>

namespace sandtest {

struct TesterOptions
{
    /// Wall-clock budget of each test case, measured from the release of its worker
    std::chrono::milliseconds timeout = std::chrono::milliseconds{2000};

    CompilerOptions compiler;
    ExecutorOptions executor;
    PolicyOptions policy;
};

/// Tests C++ submissions: a submission is the body of a `struct Test`, and each test case calls
/// one of its member functions.
///
/// Constructing the first CxxTester installs the process-wide CapabilityPolicy.
class CxxTester : public ITester
{
public:
    explicit CxxTester(TesterOptions options = {});

    std::vector<TestResult> test_submission(const Problem& problem, std::span<const TestCase> test_cases,
                                            std::string_view program_text) override;

    const TesterOptions& get_options() const { return options_; }

    /// Runs the routine registered for ``test_case`` and classifies its result. Invoked inside a
    /// sandbox worker
    static TestResult run_check(const CheckContainer& container, const TestCase& test_case);

private:
    TestResult on_fault(const WorkerFault& fault, std::string_view program_text) const;

    TesterOptions options_;
    const CapabilityPolicy* policy_;
};

} // namespace sandtest
