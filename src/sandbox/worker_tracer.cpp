#include "sandbox/worker_tracer.hpp"

#include "sandbox/traced_waitid.hpp"
#include "sandbox/worker_process.hpp"

#include <sandtest/common/error_types.hpp>
#include <sandtest/common/linux.hpp>
#include <sandtest/logging.hpp>
#include <sandtest/sandbox/capability_policy.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/any_of.hpp>

#include <array>
#include <cerrno>
#include <cstddef>
#include <csignal>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <utility>

#include <linux/audit.h>
#include <sys/ptrace.h>
#include <sys/syscall.h>
#include <sys/types.h>

namespace sandtest {

namespace {

bool is_stop_signal(int signal_num) {
    return signal_num == SIGSTOP || signal_num == SIGTSTP || signal_num == SIGTTIN || signal_num == SIGTTOU;
}

/// A system call argument that names a file descriptor
struct FdArgument
{
    long nr; // NOLINT(google-runtime-int)
    int index;
};

constexpr std::array FD_ARGUMENTS = {
    FdArgument{SYS_write, 0},
    FdArgument{SYS_writev, 0},
    FdArgument{SYS_pwrite64, 0},
    FdArgument{SYS_pwritev, 0},
#ifdef SYS_pwritev2
    FdArgument{SYS_pwritev2, 0},
#endif
    FdArgument{SYS_close, 0},
    FdArgument{SYS_dup, 0},
#ifdef SYS_dup2
    FdArgument{SYS_dup2, 0},
    FdArgument{SYS_dup2, 1},
#endif
    FdArgument{SYS_dup3, 0},
    FdArgument{SYS_dup3, 1},
    FdArgument{SYS_fcntl, 0},
    FdArgument{SYS_ioctl, 0},
    FdArgument{SYS_sendfile, 0},
    FdArgument{SYS_splice, 2},
    FdArgument{SYS_tee, 1},
    FdArgument{SYS_vmsplice, 0},
    FdArgument{SYS_copy_file_range, 2},
    FdArgument{SYS_sendto, 0},
    FdArgument{SYS_sendmsg, 0},
    FdArgument{SYS_sendmmsg, 0},
};

/// Whether the call would write to, replace or close RESULT_FD
// NOLINTNEXTLINE(google-runtime-int)
bool touches_result_fd(long syscall_nr, std::span<const std::uint64_t> args) {
    constexpr auto RESULT = static_cast<std::uint64_t>(RESULT_FD);

#ifdef SYS_close_range
    // close_range(first, last, flags)
    if (syscall_nr == SYS_close_range) {
        return static_cast<unsigned int>(args[0]) <= RESULT_FD && static_cast<unsigned int>(args[1]) >= RESULT_FD;
    }
#endif

    // Descriptors are ints; the upper half of the register is ignored by the kernel
    return ranges::any_of(FD_ARGUMENTS, [&](const FdArgument& arg) {
        return arg.nr == syscall_nr && static_cast<std::uint32_t>(args[static_cast<std::size_t>(arg.index)]) == RESULT;
    });
}

WorkerFault violation(long syscall_nr, std::string detail) { // NOLINT(google-runtime-int)
    return WorkerFault{.kind = WorkerFault::Kind::SecurityViolation,
                       .detail = std::move(detail),
                       .signal_num = std::nullopt,
                       .syscall_nr = syscall_nr};
}

} // namespace

std::uint32_t WorkerTracer::native_arch() {
#if defined(__x86_64__)
    return AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
    return AUDIT_ARCH_AARCH64;
#else
#error "sandbox workers are only supported on x86_64 and aarch64"
#endif
}

Result<void> WorkerTracer::release(pid_t pid) const {
    // Set options:
    //   Deliver a info on a syscall trap (see TracedWaitid::parse or ptrace(2))
    //   Kill the worker if we (the tracer) exit for any reason
    // NOLINTNEXTLINE(google-runtime-int)
    constexpr auto OPTIONS = static_cast<long>(PTRACE_O_TRACESYSGOOD | PTRACE_O_EXITKILL);
    TRYE(linux::ptrace(PTRACE_SETOPTIONS, pid, NULL, OPTIONS), SyscallFailure);

    // Suppress the initial SIGSTOP
    TRY(resume(pid));

    return {};
}

Result<void> WorkerTracer::resume(pid_t pid, int signal_num) {
    auto res = linux::ptrace(PTRACE_SYSCALL, pid, NULL, static_cast<long>(signal_num)); // NOLINT(google-runtime-int)

    // The worker may have been killed since reporting the stop
    if (!res && res.error() != std::errc::no_such_process) {
        return ErrorKind::SyscallFailure;
    }

    return {};
}

Result<std::optional<WorkerFault>> WorkerTracer::handle_stop(pid_t pid, const TracedWaitid& event,
                                                             TraceeState& state) const {
    if (event.is_syscall_trap) {
        return handle_syscall_stop(pid, state);
    }

    int signal_num = event.signal_num.value_or(0);

    // Group stops and stop signals would leave the worker frozen until its deadline
    if (event.type != CLD_TRAPPED || is_stop_signal(signal_num)) {
        LOG_TRACE("Worker {} suppressing stop ({})", pid, event);
        TRY(resume(pid));
        return std::nullopt;
    }

    // Signal-delivery-stop: pass the signal on, so that e.g. SIGSEGV terminates the worker as usual
    LOG_TRACE("Worker {} reinjecting {}", pid, linux::Signal{signal_num});
    TRY(resume(pid, signal_num));

    return std::nullopt;
}

Result<std::optional<WorkerFault>> WorkerTracer::handle_syscall_stop(pid_t pid, TraceeState& state) const {
    // glibc's spelling of struct ptrace_syscall_info; <linux/ptrace.h> clashes with <sys/ptrace.h>
    __ptrace_syscall_info info{};

    auto info_res = linux::ptrace(PTRACE_GET_SYSCALL_INFO, pid, sizeof(info), &info);
    if (!info_res) {
        if (info_res.error() == std::errc::no_such_process) {
            return std::nullopt;
        }
        return ErrorKind::SyscallFailure;
    }

    // Only entries are checked; exits are resumed unconditionally
    if (info.op != PTRACE_SYSCALL_INFO_ENTRY) {
        TRY(resume(pid));
        return std::nullopt;
    }

    // NOLINTNEXTLINE(google-runtime-int)
    const auto syscall_nr = static_cast<long>(info.entry.nr);

    const std::span<const std::uint64_t> args{info.entry.args};

    if (info.arch != native_arch()) {
        LOG_DEBUG("Worker {} entered syscall {} through a foreign ABI (arch {:#x})", pid, syscall_nr, info.arch);
        return violation(syscall_nr,
                         fmt::format("{} via a non-native system call ABI", CapabilityPolicy::describe(syscall_nr)));
    }

    if (!state.result_fd_unlocked) {
        // Fails with ENOSYS in the kernel, which the worker ignores
        if (syscall_nr == RESULT_UNLOCK_SYSCALL && args[0] == state.unlock_token) {
            LOG_TRACE("Worker {} unlocked its result descriptor", pid);
            state.result_fd_unlocked = true;
            TRY(resume(pid));
            return std::nullopt;
        }

        if (touches_result_fd(syscall_nr, args)) {
            LOG_DEBUG("Worker {} used the result descriptor in syscall {}", pid, syscall_nr);
            return violation(syscall_nr, fmt::format("result descriptor used by {} before the task returned",
                                                     CapabilityPolicy::describe(syscall_nr)));
        }
    }

    if (!policy_->permits_call(syscall_nr, args, pid)) {
        LOG_DEBUG("Worker {} attempted denied syscall {}", pid, CapabilityPolicy::describe(syscall_nr));
        return violation(syscall_nr, CapabilityPolicy::describe(syscall_nr));
    }

    TRY(resume(pid));

    return std::nullopt;
}

} // namespace sandtest
