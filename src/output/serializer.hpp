#pragma once

#include <sandtest/common/class_traits.hpp>
#include <sandtest/model/problem.hpp>
#include <sandtest/model/test_case.hpp>
#include <sandtest/model/test_result.hpp>

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <span>
#include <string_view>

namespace sandtest {

class Serializer : NonCopyable
{
public:
    Serializer(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Serializer() = default;

    virtual void on_submission_begin(const Problem& problem, std::string_view submission_name) = 0;

    /// ``result`` belongs to ``test_case``
    virtual void on_test_result(const TestCase& test_case, const TestResult& result) = 0;

    /// The single result reported for a submission that was never run
    virtual void on_submission_failure(const TestResult& result) = 0;

    virtual void on_summary(std::span<const TestResult> results) = 0;

    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace sandtest
