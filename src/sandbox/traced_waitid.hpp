#pragma once

#include <sandtest/common/expected.hpp>
#include <sandtest/common/formatters.hpp>
#include <sandtest/common/linux.hpp>

#include <fmt/format.h>
#include <gsl/util>

#include <cstdint>
#include <optional>

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace sandtest {

/// A decoded waitid(2) result for a (possibly traced) child
struct TracedWaitid
{
    /// The child's pid; 0 if waitid(WNOHANG) found no state change
    pid_t pid{};

    /// type is `si_code` in waitid(2). One of:
    ///  CLD_EXITED, CLD_KILLED, CLD_DUMPED, CLD_STOPPED, CLD_TRAPPED, CLD_CONTINUED
    int type{};

    /// Has value if and only if type == CLD_EXITED
    std::optional<int> exit_code;

    /// Has value if type is not CLD_EXITED
    std::optional<linux::Signal> signal_num;

    /// Whether a system call trap was delivered via ptrace (requires PTRACE_O_TRACESYSGOOD)
    bool is_syscall_trap = false;

    bool has_event() const { return pid != 0; }

    bool is_terminated() const { return type == CLD_EXITED || type == CLD_KILLED || type == CLD_DUMPED; }

    /// Polls for a state change of ``pid`` without blocking
    static Expected<TracedWaitid> poll(pid_t pid) {
        auto res = linux::waitid(P_PID, gsl::narrow_cast<id_t>(pid), WEXITED | WSTOPPED | WNOHANG);

        if (!res) {
            return res.error();
        }

        return TracedWaitid::parse(res.value());
    }

    /// Blocks until ``pid`` stops or terminates
    static Expected<TracedWaitid> wait(pid_t pid) {
        auto res = linux::waitid(P_PID, gsl::narrow_cast<id_t>(pid), WEXITED | WSTOPPED);

        if (!res) {
            return res.error();
        }

        return TracedWaitid::parse(res.value());
    }

    static TracedWaitid parse(const siginfo_t& siginfo) {
        TracedWaitid result{};
        result.pid = siginfo.si_pid;
        result.type = siginfo.si_code;

        // si_pid will only be 0 if waitid returned early from WNOHANG
        if (result.pid == 0) {
            return result;
        }

        // Regarding ptrace(2) in conjunction with waitid(2). For a system call trap with
        // PTRACE_O_TRACESYSGOOD set, the stop signal is (SIGTRAP | 0x80), which is the same as
        // siginfo.si_status
        if (result.type == CLD_EXITED) {
            result.exit_code = gsl::narrow_cast<int>(siginfo.si_status);
            return result;
        }

        constexpr std::uint32_t SIG_MASK = 0x7f;
        constexpr std::uint32_t SYSCALL_TRAP_MASK = 0x80;
        auto signal_bits = gsl::narrow_cast<std::uint32_t>(siginfo.si_status);

        // actual signal will be in first 7 bits
        result.signal_num = gsl::narrow_cast<int>(signal_bits & SIG_MASK);

        if (result.type == CLD_TRAPPED && (signal_bits & SYSCALL_TRAP_MASK) != 0) {
            result.is_syscall_trap = true;
        }

        return result;
    }
};

} // namespace sandtest

template <>
struct fmt::formatter<::sandtest::TracedWaitid> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::TracedWaitid& from, format_context& ctx) const {
        if (!from.has_event()) {
            return fmt::format_to(ctx.out(), "TracedWaitid{{no event}}");
        }

        auto out = fmt::format_to(ctx.out(), "TracedWaitid{{pid={}, type={}", from.pid, from.type);

        if (from.exit_code) {
            out = fmt::format_to(out, ", exit_code={}", *from.exit_code);
        }
        if (from.signal_num) {
            out = fmt::format_to(out, ", signal={}", *from.signal_num);
        }
        if (from.is_syscall_trap) {
            out = fmt::format_to(out, ", syscall_trap");
        }

        return fmt::format_to(out, "}}");
    }
};
