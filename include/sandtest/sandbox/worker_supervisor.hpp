#pragma once

#include <sandtest/common/class_traits.hpp>
#include <sandtest/common/formatters.hpp>
#include <sandtest/sandbox/capability_policy.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>

#include <fmt/format.h>

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sandtest {

/// Runs inside a worker and returns the encoded result payload
using WorkerBody = std::function<std::string()>;

/// What became of one worker
struct WorkerReport
{
    enum class Status {
        Completed, ///< The worker reported a result; see `payload`
        TimedOut,  ///< The worker overran its deadline and was killed
        Faulted,   ///< See `fault`
    };

    Status status = Status::Faulted;
    std::string payload;
    std::optional<WorkerFault> fault;

    std::string stdout_text;
    std::string stderr_text;
};

/// Type-erased core of KillableTaskManager.
///
/// Forks one ptrace'd worker process per body, enforces the installed CapabilityPolicy at every
/// system call entry, kills workers that overrun their deadline, and buffers each worker's
/// stdout and stderr separately. All of this happens on the calling thread, which must be the
/// same thread for the whole of run() (ptrace requires the tracer to be the forking thread).
class WorkerSupervisor : NonMovable
{
public:
    WorkerSupervisor(std::chrono::milliseconds timeout, ExecutorOptions options);

    /// Blocks until every worker has finished. reports[i] corresponds to bodies[i]
    std::vector<WorkerReport> run(std::span<const WorkerBody> bodies);

    std::chrono::milliseconds get_timeout() const { return timeout_; }

    const ExecutorOptions& get_options() const { return options_; }

private:
    std::chrono::milliseconds timeout_;
    ExecutorOptions options_;
};

} // namespace sandtest

FMT_SERIALIZE_ENUM(::sandtest::WorkerReport::Status, Completed, TimedOut, Faulted);
