#include "sandbox/worker_process.hpp"

#include <sandtest/common/formatters.hpp>
#include <sandtest/sandbox/worker_supervisor.hpp>

#include <fmt/format.h>

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>

#include <fcntl.h>
#include <signal.h>
#include <sys/ptrace.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace sandtest {

namespace {

/// Exit status of a worker that could not be set up. Only seen before tracing starts
constexpr int WORKER_SETUP_EXIT_CODE = 126;

void write_frame(int fd, std::string_view frame) {
    while (!frame.empty()) {
        ssize_t res = ::write(fd, frame.data(), frame.size());

        if (res == -1 && errno == EINTR) {
            continue;
        }
        if (res <= 0) {
            return;
        }

        frame.remove_prefix(static_cast<std::size_t>(res));
    }
}

[[noreturn]] void fail_setup(int frame_fd, const char* what) {
    std::string frame = fmt::format("{}worker setup failed at {}: {}", EXCEPTION_FRAME_TAG, what, std::strerror(errno));
    write_frame(frame_fd, frame);
    _exit(WORKER_SETUP_EXIT_CODE);
}

void close_inherited_fds() {
    constexpr unsigned int FIRST_FD = RESULT_FD + 1;

#ifdef SYS_close_range
    if (::syscall(SYS_close_range, FIRST_FD, ~0U, 0U) == 0) {
        return;
    }
#endif

    const long max_fd = ::sysconf(_SC_OPEN_MAX); // NOLINT(google-runtime-int)
    for (long fd = FIRST_FD; fd < max_fd; ++fd) { // NOLINT(google-runtime-int)
        ::close(static_cast<int>(fd));
    }
}

void setup_descriptors(const WorkerPipes& pipes) {
    // fds 0-2 are always taken, so the pipe fds can only collide with RESULT_FD, and
    // stdout/stderr are moved before RESULT_FD is overwritten
    if (::dup2(pipes.stdout_pipe.write_fd, STDOUT_FILENO) == -1 ||
        ::dup2(pipes.stderr_pipe.write_fd, STDERR_FILENO) == -1) {
        fail_setup(pipes.result_pipe.write_fd, "dup2");
    }
    if (pipes.result_pipe.write_fd != RESULT_FD && ::dup2(pipes.result_pipe.write_fd, RESULT_FD) == -1) {
        fail_setup(pipes.result_pipe.write_fd, "dup2");
    }

    // NOLINTNEXTLINE(*vararg)
    int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull == -1 || ::dup2(devnull, STDIN_FILENO) == -1) {
        fail_setup(RESULT_FD, "open /dev/null");
    }

    close_inherited_fds();
}

std::string run_body(const WorkerBody& body) {
    try {
        return RESULT_FRAME_TAG + body();
    } catch (const std::exception& ex) {
        return EXCEPTION_FRAME_TAG + fmt::format("{}", ex);
    } catch (...) {
        return EXCEPTION_FRAME_TAG + std::string{"<unknown - not derived from std::exception>"};
    }
}

} // namespace

void run_worker(const WorkerBody& body, const WorkerPipes& pipes, const sigset_t& host_mask,
                std::uint64_t unlock_token) {
    ::pthread_sigmask(SIG_SETMASK, &host_mask, nullptr);

    setup_descriptors(pipes);

    if (::ptrace(PTRACE_TRACEME, 0, nullptr, nullptr) == -1) {
        fail_setup(RESULT_FD, "PTRACE_TRACEME");
    }

    // Wait for the supervisor to release us. Every system call from here on is checked
    ::raise(SIGSTOP);

    std::string frame = run_body(body);

    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    // No handler installed by the task may run once the result descriptor is unlocked
    sigset_t all_signals;
    sigfillset(&all_signals);
    ::pthread_sigmask(SIG_BLOCK, &all_signals, nullptr);

    ::syscall(RESULT_UNLOCK_SYSCALL, unlock_token);

    write_frame(RESULT_FD, frame);
    ::close(RESULT_FD);

    // Exiting is a denied operation; the supervisor kills us once it has read the frame
    while (true) {
        ::pause();
    }
}

} // namespace sandtest
