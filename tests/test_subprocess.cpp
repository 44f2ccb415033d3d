#include "catch2_custom.hpp"

#include <sandtest/common/error_types.hpp>
#include <sandtest/common/linux.hpp>

#include "subprocess/run_result.hpp"
#include "subprocess/subprocess.hpp"

#include <chrono>
#include <string>

#include <signal.h>

using namespace std::chrono_literals;

TEST_CASE("Read /bin/echo stdout") {
    sandtest::Subprocess proc("/bin/echo", {"-n", "Hello", "world!"});
    REQUIRE(proc.start());

    auto run_res = proc.communicate("", 5s);

    REQUIRE(run_res);
    REQUIRE(run_res->is_success());
    REQUIRE(proc.get_stdout() == "Hello world!");
    REQUIRE(proc.get_stderr().empty());
}

TEST_CASE("Pipe input through /bin/cat") {
    sandtest::Subprocess proc("cat", {});
    REQUIRE(proc.start());

    // Larger than a pipe buffer, so the write has to be interleaved with reads
    std::string input(256 * 1024, 'x');
    input += "Goodbye dog...";

    auto run_res = proc.communicate(input, 5s);

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == sandtest::RunResult::Kind::Exited);
    REQUIRE(proc.get_stdout() == input);
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("Collect stderr and a non-zero exit code") {
    sandtest::Subprocess proc("sh", {"-c", "echo oops >&2; exit 3"});
    REQUIRE(proc.start());

    auto run_res = proc.communicate("", 5s);

    REQUIRE(run_res);
    REQUIRE(run_res->get_kind() == sandtest::RunResult::Kind::Exited);
    REQUIRE(run_res->get_code() == 3);
    REQUIRE(proc.get_stderr() == "oops\n");
}

TEST_CASE("A missing executable exits with 127") {
    sandtest::Subprocess proc("sandtest-this-program-does-not-exist", {});
    REQUIRE(proc.start());

    auto run_res = proc.communicate("", 5s);

    REQUIRE(run_res);
    REQUIRE(run_res->get_code() == 127);
}

TEST_CASE("A hung child is killed on timeout") {
    sandtest::Subprocess proc("sleep", {"10"});
    REQUIRE(proc.start());

    auto start = std::chrono::steady_clock::now();
    auto run_res = proc.communicate("", 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(run_res == sandtest::ErrorKind::TimedOut);
    REQUIRE(elapsed < 5s);
    REQUIRE_FALSE(proc.is_alive());
}

TEST_CASE("Signal names are human readable") {
    REQUIRE(sandtest::linux::Signal{SIGSEGV}.to_string() == "SIGSEGV (Segmentation fault)");
    REQUIRE(fmt::format("{}", sandtest::linux::Signal{SIGKILL}) == "SIGKILL (Killed)");
}
