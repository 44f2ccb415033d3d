#include "catch2_custom.hpp"

#include "sandbox/worker_process.hpp"

#include <sandtest/common/error_types.hpp>
#include <sandtest/sandbox/capability_policy.hpp>
#include <sandtest/sandbox/killable_task_manager.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>

#include <gsl/util>

#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <tuple>
#include <vector>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

using namespace std::chrono_literals;

using sandtest::ExecutorOptions;
using sandtest::RESULT_FD;
using sandtest::RESULT_UNLOCK_SYSCALL;
using sandtest::KillableTaskManager;
using sandtest::SandboxTask;
using sandtest::WorkerFault;

template <>
struct sandtest::TaskTransfer<int>
{
    static std::string encode(int value) { return std::to_string(value); }

    static Result<int> decode(std::string_view encoded) {
        int value{};
        auto [ptr, ec] = std::from_chars(encoded.data(), encoded.data() + encoded.size(), value);

        if (ec != std::errc{} || ptr != encoded.data() + encoded.size()) {
            return ErrorKind::ProtocolViolation;
        }

        return value;
    }
};

namespace {

constexpr int TIMEOUT_VALUE = -1;
constexpr int FAULT_VALUE = -2;

/// Outcome handlers that record the last fault they saw
struct Handlers
{
    std::vector<WorkerFault> faults;

    auto on_timeout() {
        return [] { return TIMEOUT_VALUE; };
    }

    auto on_fault() {
        return [this](const WorkerFault& fault) {
            faults.push_back(fault);
            return FAULT_VALUE;
        };
    }
};

KillableTaskManager<int> make_manager(std::vector<SandboxTask<int>> tasks, Handlers& handlers,
                                      std::chrono::milliseconds timeout = 2s, ExecutorOptions options = {}) {
    sandtest::CapabilityPolicy::install();
    return {std::move(tasks), timeout, handlers.on_timeout(), handlers.on_fault(), options};
}

} // namespace

TEST_CASE("Outcomes are returned in task order") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    for (int i = 0; i < 6; ++i) {
        // Later tasks finish first
        tasks.emplace_back([i] {
            std::this_thread::sleep_for(std::chrono::milliseconds{(6 - i) * 20});
            return i * i;
        });
    }

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{0, 1, 4, 9, 16, 25});
    REQUIRE(handlers.faults.empty());
}

TEST_CASE("Order is preserved with one worker at a time") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    for (int i = 0; i < 4; ++i) {
        tasks.emplace_back([i] { return 10 + i; });
    }

    auto manager = make_manager(std::move(tasks), handlers, 2s, ExecutorOptions{.max_parallel = 1});
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{10, 11, 12, 13});
}

TEST_CASE("An empty task list yields no outcomes") {
    Handlers handlers;

    auto manager = make_manager({}, handlers);
    manager.run();

    REQUIRE(manager.get_outcomes().empty());
    REQUIRE(manager.get_buffered_stdout().empty());
}

TEST_CASE("Each worker's output is buffered separately") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([] {
        std::cout << "hi";
        return 1;
    });
    tasks.emplace_back([] {
        std::cerr << "oops\n";
        return 2;
    });
    tasks.emplace_back([] {
        std::printf("from stdio %d", 3);
        return 3;
    });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{1, 2, 3});

    REQUIRE(manager.get_buffered_stdout().at(0) == "hi");
    REQUIRE(manager.get_buffered_stderr().at(0).empty());

    REQUIRE(manager.get_buffered_stdout().at(1).empty());
    REQUIRE(manager.get_buffered_stderr().at(1) == "oops\n");

    REQUIRE(manager.get_buffered_stdout().at(2) == "from stdio 3");
}

TEST_CASE("Captured output is capped") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([] {
        std::cout << std::string(10000, 'x');
        return 0;
    });

    auto manager = make_manager(std::move(tasks), handlers, 2s, ExecutorOptions{.max_output_bytes = 1000});
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{0});
    REQUIRE(manager.get_buffered_stdout().at(0) == std::string(1000, 'x'));
}

TEST_CASE("An overrunning task is killed and the others are unaffected") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([] { return 1; });
    tasks.emplace_back([] {
        volatile bool forever = true;
        while (forever) {
        }
        return 2;
    });
    tasks.emplace_back([] { return 3; });

    auto manager = make_manager(std::move(tasks), handlers, 300ms);

    auto start = std::chrono::steady_clock::now();
    manager.run();
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(manager.get_outcomes() == std::vector{1, TIMEOUT_VALUE, 3});
    REQUIRE(elapsed < 5s);
}

TEST_CASE("A denied operation is a security violation") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([]() -> int { std::exit(0); });
    tasks.emplace_back([] { return static_cast<int>(::syscall(SYS_socket, 2, 1, 0)); });
    tasks.emplace_back([] { return 7; });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE, FAULT_VALUE, 7});
    REQUIRE(handlers.faults.size() == 2);

    for (const WorkerFault& fault : handlers.faults) {
        REQUIRE(fault.kind == WorkerFault::Kind::SecurityViolation);
        REQUIRE(fault.syscall_nr.has_value());
    }
}

TEST_CASE("Signalling the host is a security violation") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([] {
        const pid_t host = ::getppid();
        return static_cast<int>(::syscall(SYS_tgkill, host, host, SIGTERM));
    });
    tasks.emplace_back([] {
        const pid_t host = ::getppid();
        return static_cast<int>(::syscall(SYS_kill, host, SIGTERM));
    });
    tasks.emplace_back([] { return 5; });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE, FAULT_VALUE, 5});
    REQUIRE(handlers.faults.size() == 2);

    REQUIRE(handlers.faults[0].kind == WorkerFault::Kind::SecurityViolation);
    REQUIRE(handlers.faults[0].syscall_nr == SYS_tgkill);
    REQUIRE(handlers.faults[0].detail == "tgkill");

    REQUIRE(handlers.faults[1].kind == WorkerFault::Kind::SecurityViolation);
    REQUIRE(handlers.faults[1].syscall_nr == SYS_kill);
}

TEST_CASE("A task cannot write its own result frame") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    // Each of these would otherwise report 7 as the result
    tasks.emplace_back([]() -> int {
        std::ignore = ::write(RESULT_FD, "R7", 2);
        while (true) {
            ::pause();
        }
    });
    tasks.emplace_back([]() -> int {
        int fd = ::dup(STDOUT_FILENO);
        ::dup2(fd, RESULT_FD);
        return 7;
    });
    tasks.emplace_back([] {
        ::close(RESULT_FD);
        return 7;
    });
    tasks.emplace_back([] { return 7; });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE, FAULT_VALUE, FAULT_VALUE, 7});
    REQUIRE(handlers.faults.size() == 3);

    for (const WorkerFault& fault : handlers.faults) {
        REQUIRE(fault.kind == WorkerFault::Kind::SecurityViolation);
        REQUIRE_THAT(fault.detail, Catch::Matchers::ContainsSubstring("result descriptor"));
    }

    REQUIRE(handlers.faults[0].syscall_nr == SYS_write);
}

TEST_CASE("Presenting a made up unlock token is a security violation") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([] {
        ::syscall(RESULT_UNLOCK_SYSCALL, 0);
        std::ignore = ::write(RESULT_FD, "R7", 2);
        return 7;
    });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE});
    REQUIRE(handlers.faults.size() == 1);
    REQUIRE(handlers.faults[0].kind == WorkerFault::Kind::SecurityViolation);
}

TEST_CASE("Creating a thread is a security violation") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([] {
        int value = 0;
        std::thread thread{[&value] { value = 1; }};
        thread.join();
        return value;
    });
    tasks.emplace_back([] { return 2; });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE, 2});
    REQUIRE(handlers.faults.size() == 1);
    REQUIRE(handlers.faults[0].kind == WorkerFault::Kind::SecurityViolation);
}

TEST_CASE("Engine setup failure is reported for every task") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([] { return 1; });
    tasks.emplace_back([] { return 2; });

    auto manager = make_manager(std::move(tasks), handlers);

    // Leave no descriptor free for the supervisor's signalfd
    int lowest_free_fd = ::open("/dev/null", O_RDONLY); // NOLINT(*vararg)
    REQUIRE(lowest_free_fd != -1);
    ::close(lowest_free_fd);

    rlimit original{};
    REQUIRE(::getrlimit(RLIMIT_NOFILE, &original) == 0);

    rlimit lowered = original;
    lowered.rlim_cur = static_cast<rlim_t>(lowest_free_fd);
    REQUIRE(::setrlimit(RLIMIT_NOFILE, &lowered) == 0);

    {
        auto restore = gsl::finally([&original] { ::setrlimit(RLIMIT_NOFILE, &original); });
        manager.run();
    }

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE, FAULT_VALUE});
    REQUIRE(handlers.faults.size() == 2);

    for (const WorkerFault& fault : handlers.faults) {
        REQUIRE(fault.kind == WorkerFault::Kind::SpawnFailed);
        REQUIRE_THAT(fault.detail, Catch::Matchers::ContainsSubstring("signalfd"));
    }
}

TEST_CASE("A crashing task reports its signal") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([]() -> int { std::abort(); });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE});
    REQUIRE(handlers.faults.size() == 1);
    REQUIRE(handlers.faults[0].kind == WorkerFault::Kind::Signaled);
    REQUIRE(handlers.faults[0].signal_num == SIGABRT);
}

TEST_CASE("An escaping exception is reported with its description") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([]() -> int { throw std::runtime_error("boom"); });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    REQUIRE(manager.get_outcomes() == std::vector{FAULT_VALUE});
    REQUIRE(handlers.faults.size() == 1);
    REQUIRE(handlers.faults[0].kind == WorkerFault::Kind::UncaughtException);
    REQUIRE_THAT(handlers.faults[0].detail, Catch::Matchers::ContainsSubstring("boom"));
}

TEST_CASE("The host keeps running after workers are killed") {
    Handlers handlers;
    std::vector<SandboxTask<int>> tasks;

    tasks.emplace_back([]() -> int { std::exit(1); });

    auto manager = make_manager(std::move(tasks), handlers);
    manager.run();

    // Still here, and able to run more work
    auto next = make_manager({[] { return ::getpid() > 0 ? 1 : 0; }}, handlers);
    next.run();

    REQUIRE(next.get_outcomes() == std::vector{1});
}
