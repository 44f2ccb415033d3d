#include "user/cl_args.hpp"

#include <sandtest/common/expected.hpp>
#include <sandtest/logging.hpp>

#include "common/terminal_checks.hpp"
#include "output/verbosity.hpp"
#include "user/program_options.hpp"

#include <argparse/argparse.hpp>
#include <fmt/color.h>
#include <fmt/format.h>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace sandtest {

CommandLineArgs::CommandLineArgs(std::span<const char*> args)
    : arg_parser_{get_basename(args[0]), SANDTEST_VERSION_STRING, argparse::default_arguments::help}
    , args_{args.begin(), args.end()} {
    // Add parser arguments
    setup_parser();
}

namespace {

void ensure_is_regular_file(const std::filesystem::path& path, fmt::format_string<std::string> fmt) {
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument(fmt::format(fmt, path.string()) + " does not exist");
    }
    if (!std::filesystem::is_regular_file(path)) {
        throw std::invalid_argument(fmt::format(fmt, path.string()) + " is not a regular file");
    }
}

template <typename IntT>
IntT parse_positive(std::string_view opt, std::string_view what) {
    IntT value{};
    auto [ptr, ec] = std::from_chars(opt.data(), opt.data() + opt.size(), value);

    if (ec != std::errc{} || ptr != opt.data() + opt.size() || value <= 0) {
        throw std::invalid_argument(fmt::format("{} must be a positive integer (got {:?})", what, opt));
    }

    return value;
}

} // namespace

void CommandLineArgs::setup_parser() {
    if (auto term_sz = terminal_size(stdout)) {
        arg_parser_.set_usage_max_line_width(term_sz->ws_col * 3 / 4);
        LOG_DEBUG("Cols = {}, px = {}", term_sz->ws_col, term_sz->ws_xpixel);
    } else {
        constexpr std::size_t DEFAULT_MAX_WIDTH = 80;
        LOG_DEBUG("Failed to get terminal size. Setting max width to 80");
        arg_parser_.set_usage_max_line_width(DEFAULT_MAX_WIDTH);
    }

    arg_parser_.add_description(fmt::format("sandtest v{}: compile a C++ submission and run it against test cases, "
                                            "each in its own sandboxed, time-limited worker",
                                            SANDTEST_VERSION_STRING));

    // clang-format off
    arg_parser_.add_argument("method")
        .store_into(opts_buffer_.method_name)
        .help("The member function of the submission's `Test` struct that every test case calls");

    // Verbatim from argparse.hpp, except replacing `-v` with `-V`
    arg_parser_.add_argument("-V", "--version")
        .default_value(false)
        .implicit_value(true)
        .nargs(0)
        .action([&](const auto & /*unused*/) {
            std::cout << SANDTEST_VERSION_STRING << '\n';
            std::exit(0);
        })
        .help("prints version information and exits");

    arg_parser_.add_argument("-s", "--submission")
        .required()
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                ensure_is_regular_file(opt, "Submission file {:?}");

                opts_buffer_.submission_path = opt;
        })
        .help("File containing the submission: the body of `struct Test`");

    arg_parser_.add_argument("-t", "--tests")
        .required()
        .metavar("FILE")
        .action([this] (const std::string& opt) {
                ensure_is_regular_file(opt, "Test case file {:?}");

                opts_buffer_.tests_path = opt;
        })
        .help("Tab-separated test case file, one \"name<TAB>input<TAB>output\" per line");

    arg_parser_.add_argument("-I", "--include")
        .metavar("HEADER")
        .append()
        .action([this] (const std::string& opt) {
                opts_buffer_.extra_includes.push_back(opt);
        })
        .help("Extra standard header to make available to the submission (e.g. \"queue\"). May be repeated");

    arg_parser_.add_argument("--timeout")
        .metavar("MS")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.timeout = std::chrono::milliseconds{parse_positive<long>(opt, "Timeout")};
        })
        .help(fmt::format("Wall-clock budget of each test case in milliseconds (default: {})",
                          ProgramOptions::DEFAULT_TIMEOUT.count()));

    arg_parser_.add_argument("--compiler")
        .metavar("EXE")
        .nargs(1)
        .store_into(opts_buffer_.compiler)
        .help("g++-compatible compiler driver (default: $CXX, or g++)");

    arg_parser_.add_argument("-j", "--jobs")
        .metavar("N")
        .nargs(1)
        .action([this] (const std::string& opt) {
                opts_buffer_.jobs = parse_positive<std::size_t>(opt, "Number of jobs");
        })
        .help("Maximum number of test cases run at once (default: all)");

    {
        // Block to reduce scope of `using enum`

        using enum VerbosityLevel;

        constexpr auto DEFAULT_VERBOSITY_VALUE =
            static_cast<VerbosityLevelUnderlyingT>(ProgramOptions::DEFAULT_VERBOSITY_LEVEL);
        constexpr auto MAX_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Max);
        constexpr auto MIN_VERBOSITY_VALUE = static_cast<VerbosityLevelUnderlyingT>(Silent);

        constexpr auto MAX_VERBOSITY_INCREASE = MAX_VERBOSITY_VALUE - DEFAULT_VERBOSITY_VALUE - 1;
        constexpr auto MAX_VERBOSITY_DECREASE = DEFAULT_VERBOSITY_VALUE - MIN_VERBOSITY_VALUE;

        arg_parser_.add_argument("-v", "--verbose")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) + 1;

                    if (level >= MAX_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification exceeds maximum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Increase verbosity level (up to {}x). -vv also prints captured output",
                              MAX_VERBOSITY_INCREASE));

        arg_parser_.add_argument("-q", "--quiet")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    auto level = static_cast<VerbosityLevelUnderlyingT>(opts_buffer_.verbosity) - 1;

                    if (level < MIN_VERBOSITY_VALUE) {
                        throw std::invalid_argument("Verbosity specification is lower than minimum level");
                    }

                    opts_buffer_.verbosity = static_cast<VerbosityLevel>(level);
                })
            .append()
            .help(fmt::format("Decrease verbosity level (up to {}x)", MAX_VERBOSITY_DECREASE));

        arg_parser_.add_argument("--silent")
            .flag()
            .action([this] (const std::string& /*unused*/) {
                    opts_buffer_.verbosity = Silent;
                })
            .help("Suppress all output except for the return code. Useful for scripting.");

        opts_buffer_.verbosity = ProgramOptions::DEFAULT_VERBOSITY_LEVEL;
    }

    arg_parser_.add_argument("-c", "--color")
        .choices("never", "auto", "always")
        .default_value(std::string{"auto"})
        .metavar("WHEN")
        .nargs(1)
        .help("When to use colors")
        .action([this] (const std::string& opt) {
                using enum ProgramOptions::ColorizeOpt;

                if (opt == "never") {
                    opts_buffer_.colorize_option = Never;
                } else if (opt == "auto") {
                    opts_buffer_.colorize_option = Auto;
                } else if (opt == "always") {
                    opts_buffer_.colorize_option = Always;
                }
        });
    // clang-format on
}

Expected<ProgramOptions, std::string> CommandLineArgs::parse() {
    try {
        arg_parser_.parse_args(args_);
    } catch (const std::exception& err) {
        return err.what();
    }

    if (auto valid = opts_buffer_.validate(); !valid) {
        return valid.error();
    }

    LOG_DEBUG("Parsed CLI arguments: {}", opts_buffer_);

    return opts_buffer_;
}

std::string CommandLineArgs::help_message() const {
    return arg_parser_.help().str();
}

std::string CommandLineArgs::usage_message() const {
    return arg_parser_.usage();
}

std::string CommandLineArgs::get_basename(std::string_view full_name) {
    return std::string{full_name.substr(full_name.find_last_of('/') + 1)};
}

ProgramOptions parse_args_or_exit(std::span<const char*> args, int exit_code) noexcept {
    CommandLineArgs cl_args{args};
    auto opts_res = cl_args.parse();

    if (!opts_res) {
        fmt::print(stderr, "{}\n{}\n", fmt::styled(opts_res.error(), fmt::fg(fmt::color::red)),
                   cl_args.usage_message());
        std::exit(exit_code);
    }

    return opts_res.value();
}

} // namespace sandtest
