#include <sandtest/logging.hpp>
#include <sandtest/model/problem.hpp>
#include <sandtest/tester/cxx_tester.hpp>

#include "app/submission_runner.hpp"
#include "app/trace_exception.hpp"
#include "output/plaintext_serializer.hpp"
#include "output/stdout_sink.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"
#include "user/test_case_reader.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <span>
#include <string>
#include <utility>

namespace {

sandtest::TesterOptions make_tester_options(const sandtest::ProgramOptions& options) {
    sandtest::TesterOptions tester_options;
    tester_options.timeout = options.timeout;
    tester_options.executor.max_parallel = options.jobs;

    if (!options.compiler.empty()) {
        tester_options.compiler.executable = options.compiler;
    }

    return tester_options;
}

} // namespace

int main(int argc, const char* argv[]) {
    using namespace sandtest;

    init_loggers();

    try {
        std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

        const ProgramOptions options = parse_args_or_exit(args);

        StdoutSink output_sink;
        auto serializer = std::make_shared<PlainTextSerializer>(output_sink, options.colorize_option, options.verbosity);

        auto program_text = read_file_contents(options.submission_path);
        if (!program_text) {
            serializer->on_error(program_text.error());
            return 1;
        }

        auto test_cases = TestCaseReader{options.tests_path}.read();
        if (!test_cases) {
            serializer->on_error(test_cases.error());
            return 1;
        }

        Problem problem{.test_name = options.method_name, .extra_includes = options.extra_includes};

        CxxTester tester{make_tester_options(options)};
        SubmissionRunner runner{tester, serializer};

        auto results = runner.run(problem, *test_cases, *program_text, options.submission_path.string());

        return static_cast<int>(SubmissionRunner::num_failed(results));
    } catch (const std::exception& ex) {
        trace_exception(ex);
    } catch (...) {
        trace_exception("<unknown - not derived from std::exception>");
    }

    return 1;
}
