#include "subprocess/subprocess.hpp"

#include "subprocess/run_result.hpp"

#include <sandtest/common/error_types.hpp>
#include <sandtest/common/expected.hpp>
#include <sandtest/common/linux.hpp>
#include <sandtest/logging.hpp>

#include <gsl/util>
#include <libassert/assert.hpp>

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <string>
#include <string_view>
#include <thread>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandtest {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// Exit code of a child that could not exec its program, same as a shell's "command not found"
constexpr int EXEC_FAILURE_EXIT_CODE = 127;

void close_if_open(int& fd) {
    if (fd != -1) {
        std::ignore = linux::close(fd);
        fd = -1;
    }
}

/// Reads whatever is available on ``fd`` into ``buffer``. Closes ``fd`` on EOF.
Result<void> drain_into(int& fd, std::string& buffer) {
    auto res = linux::read(fd, READ_CHUNK_SIZE);

    if (!res) {
        if (res.error() == std::errc::resource_unavailable_try_again || res.error() == std::errc::interrupted) {
            return {};
        }
        return ErrorKind::SyscallFailure;
    }

    if (res->empty()) {
        close_if_open(fd);
        return {};
    }

    buffer += *res;

    return {};
}

} // namespace

Subprocess::Subprocess(std::string exec, std::vector<std::string> args)
    : exec_{std::move(exec)}
    , args_{std::move(args)} {}

Subprocess::~Subprocess() {
    // if child_pid_ == 0, then initialization failed, or the object was moved from
    if (child_pid_ == 0) {
        return;
    }

    std::ignore = close_pipes();

    if (!run_result_) {
        std::ignore = kill();
    }
}

Subprocess::Subprocess(Subprocess&& other) noexcept
    : child_pid_{std::exchange(other.child_pid_, 0)}
    , stdin_pipe_{std::exchange(other.stdin_pipe_, {-1, -1})}
    , stdout_pipe_{std::exchange(other.stdout_pipe_, {-1, -1})}
    , stderr_pipe_{std::exchange(other.stderr_pipe_, {-1, -1})}
    , stdout_buffer_{std::exchange(other.stdout_buffer_, {})}
    , stderr_buffer_{std::exchange(other.stderr_buffer_, {})}
    , run_result_{std::exchange(other.run_result_, std::nullopt)}
    , exec_{std::move(other.exec_)}
    , args_{std::move(other.args_)} {}

Subprocess& Subprocess::operator=(Subprocess&& rhs) noexcept {
    child_pid_ = std::exchange(rhs.child_pid_, 0);
    stdin_pipe_ = std::exchange(rhs.stdin_pipe_, {-1, -1});
    stdout_pipe_ = std::exchange(rhs.stdout_pipe_, {-1, -1});
    stderr_pipe_ = std::exchange(rhs.stderr_pipe_, {-1, -1});
    stdout_buffer_ = std::exchange(rhs.stdout_buffer_, {});
    stderr_buffer_ = std::exchange(rhs.stderr_buffer_, {});
    run_result_ = std::exchange(rhs.run_result_, std::nullopt);
    exec_ = std::move(rhs.exec_);
    args_ = std::move(rhs.args_);

    return *this;
}

Result<void> Subprocess::start() {
    return create(exec_, args_);
}

bool Subprocess::is_alive() const {
    return child_pid_ != 0 && !run_result_ &&
           linux::kill(child_pid_, 0) != std::make_error_code(std::errc::no_such_process);
}

Result<void> Subprocess::kill() {
    ASSERT(child_pid_ != 0, "kill() called on a subprocess that was never started");

    std::ignore = close_pipes();
    TRYE(linux::kill(child_pid_, SIGKILL), SyscallFailure);

    auto waitid_res = TRYE(linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED), SyscallFailure);
    run_result_ = RunResult::make_killed(waitid_res.si_status);

    return {};
}

Result<RunResult> Subprocess::communicate(std::string_view input, std::chrono::milliseconds timeout) {
    using std::chrono::steady_clock;

    ASSERT(child_pid_ != 0, "communicate() called before start()");

    const auto deadline = steady_clock::now() + timeout;

    // A child that exits without reading all of its input would otherwise deliver SIGPIPE to us
    sigset_t sigpipe_set;
    sigemptyset(&sigpipe_set);
    sigaddset(&sigpipe_set, SIGPIPE);
    const sigset_t prev_mask = TRYE(linux::sigprocmask(SIG_BLOCK, sigpipe_set), SyscallFailure);
    auto restore_mask = gsl::finally([&] {
        // discard a SIGPIPE raised by our own writes before unblocking
        timespec no_wait{};
        while (sigtimedwait(&sigpipe_set, nullptr, &no_wait) == SIGPIPE) {
        }
        std::ignore = linux::sigprocmask(SIG_SETMASK, prev_mask);
    });

    if (input.empty()) {
        close_if_open(stdin_pipe_.write_fd);
    }

    while (stdout_pipe_.read_fd != -1 || stderr_pipe_.read_fd != -1) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - steady_clock::now());

        if (remaining.count() <= 0) {
            LOG_WARN("{} exceeded its timeout of {}; killing it", exec_, timeout);
            TRY(kill());
            return ErrorKind::TimedOut;
        }

        std::vector<pollfd> fds;
        if (stdin_pipe_.write_fd != -1) {
            fds.push_back({.fd = stdin_pipe_.write_fd, .events = POLLOUT, .revents = 0});
        }
        if (stdout_pipe_.read_fd != -1) {
            fds.push_back({.fd = stdout_pipe_.read_fd, .events = POLLIN, .revents = 0});
        }
        if (stderr_pipe_.read_fd != -1) {
            fds.push_back({.fd = stderr_pipe_.read_fd, .events = POLLIN, .revents = 0});
        }

        TRYE(linux::poll(fds, remaining), SyscallFailure);

        for (const pollfd& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (entry.fd == stdin_pipe_.write_fd) {
                if ((entry.revents & (POLLERR | POLLHUP)) != 0) {
                    LOG_DEBUG("{} closed its stdin with {} bytes unsent", exec_, input.size());
                    close_if_open(stdin_pipe_.write_fd);
                    continue;
                }

                auto written = linux::write(stdin_pipe_.write_fd, input);
                if (written) {
                    input.remove_prefix(gsl::narrow_cast<std::size_t>(written.value()));
                } else if (written.error() != std::errc::resource_unavailable_try_again) {
                    close_if_open(stdin_pipe_.write_fd);
                    continue;
                }

                if (input.empty()) {
                    close_if_open(stdin_pipe_.write_fd);
                }
            } else if (entry.fd == stdout_pipe_.read_fd) {
                TRY(drain_into(stdout_pipe_.read_fd, stdout_buffer_));
            } else if (entry.fd == stderr_pipe_.read_fd) {
                TRY(drain_into(stderr_pipe_.read_fd, stderr_buffer_));
            }
        }
    }

    close_if_open(stdin_pipe_.write_fd);

    // Both output streams hit EOF; the child should be exiting now
    while (steady_clock::now() < deadline) {
        auto waitid_res = TRYE(linux::waitid(P_PID, gsl::narrow_cast<id_t>(child_pid_), WEXITED | WNOHANG),
                               SyscallFailure);

        // si_pid will only be 0 if waitid returned early from WNOHANG
        if (waitid_res.si_pid != 0) {
            if (waitid_res.si_code == CLD_EXITED) {
                run_result_ = RunResult::make_exited(waitid_res.si_status);
            } else {
                run_result_ = RunResult::make_killed(waitid_res.si_status);
            }

            LOG_DEBUG("{} finished: {}", exec_, *run_result_);
            return *run_result_;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    }

    LOG_WARN("{} closed its output but did not exit within {}; killing it", exec_, timeout);
    TRY(kill());

    return ErrorKind::TimedOut;
}

Result<void> Subprocess::close_pipes() {
    close_if_open(stdin_pipe_.write_fd);
    close_if_open(stdout_pipe_.read_fd);
    close_if_open(stderr_pipe_.read_fd);

    return {};
}

Result<void> Subprocess::create(const std::string& exec, const std::vector<std::string>& args) {
    stdin_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stdout_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);
    stderr_pipe_ = TRYE(linux::pipe2(O_CLOEXEC), SyscallFailure);

    // Unflushed stdio buffers would otherwise be written twice
    std::fflush(nullptr);

    linux::Fork fork_res = TRYE(linux::fork(), SyscallFailure);

    // Child process
    if (fork_res.which == linux::Fork::Child) {
        if (init_child()) {
            std::ignore = linux::execvp(exec, args);
        }

        _exit(EXEC_FAILURE_EXIT_CODE);
    }

    // Parent process
    child_pid_ = fork_res.pid;

    return init_parent();
}

Result<void> Subprocess::init_child() {
    TRYE(linux::dup2(stdin_pipe_.read_fd, STDIN_FILENO), SyscallFailure);
    TRYE(linux::dup2(stdout_pipe_.write_fd, STDOUT_FILENO), SyscallFailure);
    TRYE(linux::dup2(stderr_pipe_.write_fd, STDERR_FILENO), SyscallFailure);

    // All original pipe fds are O_CLOEXEC, so exec closes them for us
    return {};
}

Result<void> Subprocess::init_parent() {
    // Close the pipe ends being used in the child proc
    TRYE(linux::close(std::exchange(stdin_pipe_.read_fd, -1)), SyscallFailure);
    TRYE(linux::close(std::exchange(stdout_pipe_.write_fd, -1)), SyscallFailure);
    TRYE(linux::close(std::exchange(stderr_pipe_.write_fd, -1)), SyscallFailure);

    // Make all of our ends non-blocking, as communicate() multiplexes them with poll
    for (int fd : {stdin_pipe_.write_fd, stdout_pipe_.read_fd, stderr_pipe_.read_fd}) {
        int pre_flags = TRYE(linux::fcntl(fd, F_GETFL), SyscallFailure);

        TRYE(linux::fcntl(fd, F_SETFL, pre_flags | O_NONBLOCK), // NOLINT
             SyscallFailure);
    }

    return {};
}

} // namespace sandtest
