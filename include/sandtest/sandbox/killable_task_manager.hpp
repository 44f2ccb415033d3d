#pragma once

#include <sandtest/common/class_traits.hpp>
#include <sandtest/logging.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>
#include <sandtest/sandbox/worker_supervisor.hpp>

#include <libassert/assert.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace sandtest {

/// Runs independent tasks concurrently, each in its own sandbox worker, with a hard per-task
/// wall-clock budget.
///
/// Every task yields exactly one outcome, in task order: its own result, on_timeout() if it
/// overran, or on_fault(fault) if the worker ended without a usable result.
template <Transferable T>
class KillableTaskManager : NonCopyable
{
public:
    using TimeoutHandler = std::function<T()>;
    using FaultHandler = std::function<T(const WorkerFault&)>;

    KillableTaskManager(std::vector<SandboxTask<T>> tasks, std::chrono::milliseconds timeout,
                        TimeoutHandler on_timeout, FaultHandler on_fault, ExecutorOptions options = {})
        : tasks_{std::move(tasks)}
        , timeout_{timeout}
        , on_timeout_{std::move(on_timeout)}
        , on_fault_{std::move(on_fault)}
        , options_{options} {}

    /// Blocks until every task has an outcome. May only be called once
    void run() {
        ASSERT(!has_run_, "KillableTaskManager::run may only be called once");
        has_run_ = true;

        std::vector<WorkerBody> bodies;
        bodies.reserve(tasks_.size());

        for (const SandboxTask<T>& task : tasks_) {
            bodies.emplace_back([&task] { return TaskTransfer<T>::encode(task()); });
        }

        WorkerSupervisor supervisor{timeout_, options_};
        std::vector<WorkerReport> reports = supervisor.run(bodies);

        ASSERT(reports.size() == tasks_.size());

        outcomes_.reserve(reports.size());

        for (std::size_t i = 0; i < reports.size(); ++i) {
            WorkerReport& report = reports[i];

            outcomes_.push_back(to_outcome(report));
            buffered_stdout_.emplace(i, std::move(report.stdout_text));
            buffered_stderr_.emplace(i, std::move(report.stderr_text));
        }
    }

    /// outcomes[i] corresponds to tasks[i]
    const std::vector<T>& get_outcomes() const {
        ASSERT(has_run_, "KillableTaskManager::run has not been called");
        return outcomes_;
    }

    const std::unordered_map<std::size_t, std::string>& get_buffered_stdout() const { return buffered_stdout_; }

    const std::unordered_map<std::size_t, std::string>& get_buffered_stderr() const { return buffered_stderr_; }

private:
    T to_outcome(const WorkerReport& report) const {
        switch (report.status) {
        case WorkerReport::Status::Completed: {
            auto decoded = TaskTransfer<T>::decode(report.payload);

            if (!decoded) {
                LOG_ERROR("Could not decode a worker's result ({}): {:?}", decoded.error(), report.payload);
                return on_fault_(WorkerFault{.kind = WorkerFault::Kind::CorruptResult,
                                             .detail = fmt::format("undecodable result ({})", decoded.error()),
                                             .signal_num = std::nullopt,
                                             .syscall_nr = std::nullopt});
            }

            return std::move(decoded.value());
        }
        case WorkerReport::Status::TimedOut:
            return on_timeout_();
        case WorkerReport::Status::Faulted:
            break;
        }

        ASSERT(report.fault.has_value(), "faulted worker without a fault");
        return on_fault_(*report.fault);
    }

    std::vector<SandboxTask<T>> tasks_;
    std::chrono::milliseconds timeout_;
    TimeoutHandler on_timeout_;
    FaultHandler on_fault_;
    ExecutorOptions options_;

    bool has_run_ = false;
    std::vector<T> outcomes_;
    std::unordered_map<std::size_t, std::string> buffered_stdout_;
    std::unordered_map<std::size_t, std::string> buffered_stderr_;
};

} // namespace sandtest
