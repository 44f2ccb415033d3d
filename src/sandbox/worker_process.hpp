#pragma once

#include <sandtest/common/linux.hpp>
#include <sandtest/sandbox/worker_supervisor.hpp>

#include <cstdint>
#include <string_view>

#include <signal.h>

namespace sandtest {

/// Descriptor on which a worker writes its result frame
inline constexpr int RESULT_FD = 3;

/// Out-of-range system call number a worker issues, with its unlock token, once its body has
/// returned. Until then the tracer treats any use of RESULT_FD as a violation
inline constexpr long RESULT_UNLOCK_SYSCALL = 0x5a7e57; // NOLINT(google-runtime-int)

/// Frame tags, the first byte of a result frame
inline constexpr char RESULT_FRAME_TAG = 'R';
inline constexpr char EXCEPTION_FRAME_TAG = 'E';

struct WorkerPipes
{
    linux::Pipe stdout_pipe;
    linux::Pipe stderr_pipe;
    linux::Pipe result_pipe;
};

/// Body of a freshly forked worker. Never returns.
///
/// Sets up the worker's descriptors (stdin from /dev/null, stdout, stderr and RESULT_FD onto
/// ``pipes``, everything else closed), asks to be traced and stops until the supervisor releases
/// it. Then runs ``body``, blocks all signals, presents ``unlock_token`` through RESULT_UNLOCK_SYSCALL
/// and writes its frame to RESULT_FD: RESULT_FRAME_TAG + payload, or EXCEPTION_FRAME_TAG + description
/// if ``body`` threw. Finally idles until it is killed.
///
/// Nothing here may log: the worker's stderr belongs to the code under test.
[[noreturn]] void run_worker(const WorkerBody& body, const WorkerPipes& pipes, const sigset_t& host_mask,
                             std::uint64_t unlock_token);

} // namespace sandtest
