#pragma once

#include <sandtest/common/expected.hpp>
#include <sandtest/common/formatters.hpp>
#include <sandtest/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/ptrace.h>
#include <sys/signalfd.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandtest::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes to a file descriptor. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<ssize_t> write(int fd, std::string_view data) {
    ssize_t res = ::write(fd, data.data(), data.size());

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("write failed: '{}'", err);
        return err;
    }

    return res;
}

/// reads fromm a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = ::read(fd, buffer.data(), count);

    if (res == -1) {
        auto err = make_error_code(errno);

        // EAGAIN is routine for non-blocking pipes
        if (err != std::errc::resource_unavailable_try_again) {
            LOG_DEBUG("read failed: '{}'", err);
        }
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err);
        return err;
    }

    return {};
}

/// Searches PATH for ``file`` when it contains no slash. See execvp(3)
/// ``args`` does NOT need to include argv[0] or a terminating NULL; both are added for you.
/// Only returns on failure
inline Expected<> execvp(const std::string& file, const std::vector<std::string>& args) {
    // Reason: execvp requires non-const strings
    // NOLINTBEGIN(cppcoreguidelines-pro-type-const-cast)
    std::vector<char*> cstr_arg_list(args.size() + 2, nullptr);

    auto to_cstr = [](const std::string& str) { return const_cast<char*>(str.c_str()); };

    cstr_arg_list.front() = const_cast<char*>(file.c_str());
    ranges::transform(args, cstr_arg_list.begin() + 1, to_cstr);
    // NOLINTEND(cppcoreguidelines-pro-type-const-cast)

    ::execvp(file.c_str(), cstr_arg_list.data());

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if type == child
};

/// see fork(2)
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    int res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see dup(2)
/// returns success/failure; logs failure at debug level
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        auto err = make_error_code(errno);

        if (res == -1) {
            LOG_DEBUG("dup2 failed: '{}'", err);
        } else {
            LOG_DEBUG("dup2 failed (INVALID RETURN CODE = {}): '{}'", res, err);
        }

        return err;
    }

    return {};
}

/// see fcntl(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> fcntl(int fd, int cmd, std::optional<int> arg = std::nullopt) {
    int res{};

    if (arg) {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd, arg.value());
    } else {
        // NOLINTNEXTLINE(*vararg)
        res = ::fcntl(fd, cmd);
    }

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("fcntl failed: '{}'", err);

        return err;
    }

    return Expected<int>{res};
}

/// see waitid(2)
/// With WNOHANG and no state change, the returned siginfo has si_pid == 0
/// returns success/failure; logs failure at debug level
inline Expected<siginfo_t> waitid(idtype_t idtype, id_t id, int options = WSTOPPED | WEXITED) {
    siginfo_t info{};
    int res = ::waitid(idtype, id, &info, options);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("waitid failed: '{}'", err);

        return err;
    }

    return info;
}

struct Pipe
{
    int read_fd;
    int write_fd;
};

// Ensure that fds are packed so that pipe works properly
static_assert(offsetof(Pipe, read_fd) + sizeof(Pipe::read_fd) == offsetof(Pipe, write_fd));

/// see pipe2(2)
/// returns success/failure; logs failure at debug level
inline Expected<Pipe> pipe2(int flags = 0) {
    Pipe pipe{};

    int res = ::pipe2(&pipe.read_fd, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("pipe failed: '{}'", err);

        return err;
    }

    return pipe;
}

/// see memfd_create(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> memfd_create(const std::string& name, unsigned int flags = MFD_CLOEXEC) {
    int res = ::memfd_create(name.c_str(), flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("memfd_create failed: '{}'", err);

        return err;
    }

    return res;
}

/// see poll(2)
/// returns the number of ready descriptors (0 on timeout); EINTR is reported as 0 ready descriptors
inline Expected<int> poll(std::vector<pollfd>& fds, std::chrono::milliseconds timeout) {
    int res = ::poll(fds.data(), fds.size(), static_cast<int>(timeout.count()));

    if (res == -1) {
        if (errno == EINTR) {
            return 0;
        }

        auto err = make_error_code(errno);

        LOG_DEBUG("poll failed: '{}'", err);

        return err;
    }

    return res;
}

/// see pthread_sigmask(3). Only affects the calling thread
/// returns the previous mask; logs failure at debug level
inline Expected<sigset_t> sigprocmask(int how, const sigset_t& set) {
    sigset_t old_set;

    // pthread_sigmask returns the error number instead of setting errno
    if (int res = ::pthread_sigmask(how, &set, &old_set); res != 0) {
        auto err = make_error_code(res);

        LOG_DEBUG("pthread_sigmask failed: '{}'", err);

        return err;
    }

    return old_set;
}

/// see signalfd(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> signalfd(const sigset_t& mask, int flags = SFD_NONBLOCK | SFD_CLOEXEC) {
    int res = ::signalfd(-1, &mask, flags);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("signalfd failed: '{}'", err);

        return err;
    }

    return res;
}

/// see ptrace(2)
/// returns success/failure; logs failure at debug level
// NOLINTBEGIN(google-runtime-int)
//! @cond DoNotRaiseWarning
template <typename AddrT = void*, typename DataT = void*>
//! @endcond
    requires(sizeof(AddrT) <= sizeof(void*) && sizeof(DataT) <= sizeof(void*))
inline Expected<long> ptrace(int request, pid_t pid = 0, AddrT addr = NULL, DataT data = NULL) {
    //  clear errno before calling
    errno = 0;

    // Reasoning
    //   google-runtime-int                 : `long` is based on ptrace(2) spec
    //   cppcoreguidelines-pro-type-vararg  : this is a wrapper for ptrace
    //   reinterpret-cast                   : ptrace spec is `void*`, caller of this wrapper should not care
    // NOLINTBEGIN(cppcoreguidelines-pro-type-vararg,cppcoreguidelines-pro-type-reinterpret-cast)
    long res = ::ptrace(static_cast<enum __ptrace_request>(request), pid, reinterpret_cast<void*>(addr),
                        reinterpret_cast<void*>(data));
    // NOLINTEND(cppcoreguidelines-pro-type-vararg,cppcoreguidelines-pro-type-reinterpret-cast)
    // NOLINTEND(google-runtime-int)

    // see the Return section of ptrace(2)
    if (errno) {
        auto err = make_error_code(errno);

        LOG_DEBUG("ptrace(req={}, pid={}) failed: '{}'", request, pid, err);

        return err;
    }

    return res;
}

/// see getpid(2)
/// this function "cannot fail" according to the manpage. This wrapper is provided
/// just for consistency.
inline Expected<pid_t> getpid() {
    return ::getpid();
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    /// e.g. "SIGSEGV (Segmentation fault)"
    std::string to_string() const {
        const char* abbrev = sigabbrev_np(signal_num_);
        const char* descr = sigdescr_np(signal_num_);

        if (abbrev == nullptr || descr == nullptr) {
            return fmt::format("signal {}", signal_num_);
        }

        return fmt::format("SIG{} ({})", abbrev, descr);
    }

private:
    int signal_num_;
};

} // namespace sandtest::linux

template <>
struct fmt::formatter<::sandtest::linux::Signal> : formatter<std::string>
{
    auto format(const ::sandtest::linux::Signal& from, fmt::format_context& ctx) const {
        return formatter<std::string>::format(from.to_string(), ctx);
    }
};
