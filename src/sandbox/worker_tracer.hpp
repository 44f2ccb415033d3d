#pragma once

#include "sandbox/traced_waitid.hpp"

#include <sandtest/common/error_types.hpp>
#include <sandtest/sandbox/capability_policy.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>

#include <cstdint>
#include <optional>

#include <sys/types.h>

namespace sandtest {

/// What the tracer knows about one worker
struct TraceeState
{
    /// Token the worker presents through RESULT_UNLOCK_SYSCALL once its task body has returned
    std::uint64_t unlock_token = 0;

    /// Until unlocked, any use of RESULT_FD is a violation
    bool result_fd_unlocked = false;
};

/// The ptrace side of a sandbox worker: releases it, and services each stop it reports
class WorkerTracer
{
public:
    explicit WorkerTracer(const CapabilityPolicy& policy)
        : policy_{&policy} {}

    /// To be called once the worker has reported its initial SIGSTOP (see run_worker).
    /// Sets tracing options and lets the worker run until its next system call.
    Result<void> release(pid_t pid) const;

    /// Handles one ptrace stop of ``pid``.
    ///
    /// Returns a SecurityViolation fault when the worker is at the entry of a denied system call;
    /// the worker is then left stopped, and must be killed by the caller. Otherwise the worker is
    /// resumed, with any pending (non-stop) signal reinjected.
    Result<std::optional<WorkerFault>> handle_stop(pid_t pid, const TracedWaitid& event, TraceeState& state) const;

    /// AUDIT_ARCH_* value of system calls made through this platform's native ABI
    static std::uint32_t native_arch();

private:
    Result<std::optional<WorkerFault>> handle_syscall_stop(pid_t pid, TraceeState& state) const;

    /// Resumes until the next syscall entry/exit, delivering ``signal_num`` (0 = none)
    static Result<void> resume(pid_t pid, int signal_num = 0);

    const CapabilityPolicy* policy_;
};

} // namespace sandtest
