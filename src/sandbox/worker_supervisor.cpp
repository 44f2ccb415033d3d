#include <sandtest/sandbox/worker_supervisor.hpp>

#include "sandbox/traced_waitid.hpp"
#include "sandbox/worker_process.hpp"
#include "sandbox/worker_tracer.hpp"

#include <sandtest/common/error_types.hpp>
#include <sandtest/common/linux.hpp>
#include <sandtest/logging.hpp>
#include <sandtest/sandbox/capability_policy.hpp>
#include <sandtest/sandbox/sandbox_task.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <range/v3/algorithm/count_if.hpp>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdio>
#include <iostream>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sandtest {

namespace {

using Clock = std::chrono::steady_clock;

constexpr std::size_t READ_CHUNK_SIZE = 64 * 1024;

/// Upper bound on a single poll, in case a SIGCHLD is picked up by another thread
constexpr std::chrono::milliseconds MAX_POLL_INTERVAL{50};

/// Bounds how long one busy worker can hold the supervisor before others are serviced
constexpr int MAX_STOPS_PER_SWEEP = 256;

/// One captured stream of a worker
struct Capture
{
    int fd = -1;
    std::string data;
    std::size_t limit = 0;
    bool truncated = false;

    bool is_open() const { return fd != -1; }

    void close() {
        if (fd != -1) {
            std::ignore = linux::close(fd);
            fd = -1;
        }
    }

    /// Reads what is currently available. Closes the stream on EOF
    void drain() {
        while (is_open()) {
            auto res = linux::read(fd, READ_CHUNK_SIZE);

            if (!res) {
                if (res.error() != std::errc::resource_unavailable_try_again &&
                    res.error() != std::errc::interrupted) {
                    close();
                }
                return;
            }

            if (res->empty()) {
                close();
                return;
            }

            std::size_t room = limit > data.size() ? limit - data.size() : 0;
            if (res->size() > room) {
                truncated = true;
            }
            data.append(*res, 0, std::min(room, res->size()));
        }
    }
};

struct Slot
{
    enum class State { Pending, Running, Finished };

    std::size_t index{};
    State state = State::Pending;
    pid_t pid{};

    Capture out;
    Capture err;
    Capture frame;

    Clock::time_point deadline;

    bool timed_out = false;
    bool killed_by_supervisor = false;
    std::optional<WorkerFault> violation;
    std::optional<WorkerFault> spawn_failure;
    std::optional<TracedWaitid> termination;

    TraceeState trace;

    bool frame_received() const { return !frame.is_open() && !frame.data.empty(); }
};

/// State of a single WorkerSupervisor::run call
class SupervisorRun
{
public:
    SupervisorRun(std::span<const WorkerBody> bodies, std::chrono::milliseconds timeout,
                  const ExecutorOptions& options, const CapabilityPolicy& policy)
        : bodies_{bodies}
        , timeout_{timeout}
        , options_{options}
        , tracer_{policy}
        , slots_(bodies.size()) {
        for (std::size_t i = 0; i < slots_.size(); ++i) {
            slots_[i].index = i;
            slots_[i].out.limit = options_.max_output_bytes;
            slots_[i].err.limit = options_.max_output_bytes;
            // The frame is the task's result, never truncated
            slots_[i].frame.limit = std::string::npos;
        }
    }

    std::vector<WorkerReport> execute();

private:
    /// Fails every slot without starting any worker
    std::vector<WorkerReport> fail_all(const std::string& what);

    void launch_pending();
    void spawn(Slot& slot);
    void poll_events();
    void service(Slot& slot);
    void enforce_deadline(Slot& slot, Clock::time_point now);
    void kill_worker(Slot& slot);
    void finish(Slot& slot);

    std::chrono::milliseconds next_poll_timeout() const;
    std::size_t count_in(Slot::State state) const;

    static void mark_spawn_failed(Slot& slot, const std::string& what);
    static WorkerReport classify(Slot& slot);

    std::span<const WorkerBody> bodies_;
    std::chrono::milliseconds timeout_;
    ExecutorOptions options_;
    WorkerTracer tracer_;

    std::vector<Slot> slots_;

    std::mt19937_64 unlock_tokens_{std::random_device{}()};

    int signal_fd_ = -1;
    sigset_t host_mask_{};
};

std::size_t SupervisorRun::count_in(Slot::State state) const {
    return gsl::narrow_cast<std::size_t>(
        ranges::count_if(slots_, [state](const Slot& slot) { return slot.state == state; }));
}

std::vector<WorkerReport> SupervisorRun::execute() {
    sigset_t sigchld_set;
    sigemptyset(&sigchld_set);
    sigaddset(&sigchld_set, SIGCHLD);

    // SIGCHLD must be blocked to be read from a signalfd
    auto prev_mask = linux::sigprocmask(SIG_BLOCK, sigchld_set);
    if (!prev_mask) {
        return fail_all(fmt::format("could not block SIGCHLD: {}", prev_mask.error()));
    }
    host_mask_ = prev_mask.value();
    auto restore_mask = gsl::finally([this] { std::ignore = linux::sigprocmask(SIG_SETMASK, host_mask_); });

    auto signal_fd = linux::signalfd(sigchld_set);
    if (!signal_fd) {
        return fail_all(fmt::format("could not create signalfd: {}", signal_fd.error()));
    }
    signal_fd_ = signal_fd.value();
    auto close_signal_fd = gsl::finally([this] { std::ignore = linux::close(signal_fd_); });

    while (count_in(Slot::State::Finished) < slots_.size()) {
        launch_pending();

        if (count_in(Slot::State::Running) == 0) {
            continue;
        }

        poll_events();

        const auto now = Clock::now();
        for (Slot& slot : slots_) {
            if (slot.state != Slot::State::Running) {
                continue;
            }

            service(slot);
            enforce_deadline(slot, now);

            if (slot.termination) {
                finish(slot);
            }
        }
    }

    std::vector<WorkerReport> reports;
    reports.reserve(slots_.size());

    for (Slot& slot : slots_) {
        reports.push_back(classify(slot));
    }

    return reports;
}

std::vector<WorkerReport> SupervisorRun::fail_all(const std::string& what) {
    LOG_ERROR("Could not start any worker: {}", what);

    std::vector<WorkerReport> reports;
    reports.reserve(slots_.size());

    for (Slot& slot : slots_) {
        mark_spawn_failed(slot, what);
        reports.push_back(classify(slot));
    }

    return reports;
}

void SupervisorRun::mark_spawn_failed(Slot& slot, const std::string& what) {
    slot.spawn_failure = WorkerFault{
        .kind = WorkerFault::Kind::SpawnFailed, .detail = what, .signal_num = std::nullopt, .syscall_nr = std::nullopt};
    slot.out.close();
    slot.err.close();
    slot.frame.close();
    slot.state = Slot::State::Finished;
}

void SupervisorRun::launch_pending() {
    for (Slot& slot : slots_) {
        if (options_.max_parallel != 0 && count_in(Slot::State::Running) >= options_.max_parallel) {
            return;
        }

        if (slot.state == Slot::State::Pending) {
            spawn(slot);
        }
    }
}

void SupervisorRun::spawn(Slot& slot) {
    auto fail = [&slot](const std::string& what) {
        LOG_ERROR("Could not start worker {}: {}", slot.index, what);
        mark_spawn_failed(slot, what);
    };

    WorkerPipes pipes{.stdout_pipe = {-1, -1}, .stderr_pipe = {-1, -1}, .result_pipe = {-1, -1}};

    auto close_write_ends = [&pipes] {
        for (int fd : {pipes.stdout_pipe.write_fd, pipes.stderr_pipe.write_fd, pipes.result_pipe.write_fd}) {
            if (fd != -1) {
                std::ignore = linux::close(fd);
            }
        }
    };

    for (auto [pipe, capture] : {std::pair{&pipes.stdout_pipe, &slot.out}, std::pair{&pipes.stderr_pipe, &slot.err},
                                 std::pair{&pipes.result_pipe, &slot.frame}}) {
        auto res = linux::pipe2(O_CLOEXEC);
        if (!res) {
            close_write_ends();
            fail(fmt::format("pipe2: {}", res.error()));
            return;
        }
        *pipe = res.value();
        capture->fd = pipe->read_fd;

        // Only our end is non-blocking; the worker writes as it would to a terminal
        auto flags = linux::fcntl(pipe->read_fd, F_GETFL);
        if (!flags || !linux::fcntl(pipe->read_fd, F_SETFL, flags.value() | O_NONBLOCK)) { // NOLINT
            close_write_ends();
            fail("could not make output pipe non-blocking");
            return;
        }
    }

    // Unflushed buffers would otherwise be duplicated into the worker and written twice
    std::cout.flush();
    std::cerr.flush();
    std::fflush(nullptr);

    slot.trace = TraceeState{.unlock_token = unlock_tokens_(), .result_fd_unlocked = false};

    auto fork_res = linux::fork();
    if (!fork_res) {
        close_write_ends();
        fail(fmt::format("fork: {}", fork_res.error()));
        return;
    }

    if (fork_res->which == linux::Fork::Child) {
        run_worker(bodies_[slot.index], pipes, host_mask_, slot.trace.unlock_token);
    }

    close_write_ends();
    slot.pid = fork_res->pid;
    slot.state = Slot::State::Running;

    // Wait for the worker's initial SIGSTOP (see run_worker)
    auto initial = TracedWaitid::wait(slot.pid);
    if (!initial) {
        LOG_ERROR("waitid on new worker {} failed: {}", slot.pid, initial.error());
        kill_worker(slot);
        return;
    }

    if (initial->is_terminated()) {
        LOG_WARN("Worker {} ended before it could be traced ({})", slot.pid, *initial);
        slot.termination = *initial;
        return;
    }

    if (!tracer_.release(slot.pid)) {
        LOG_ERROR("Could not release worker {}", slot.pid);
        kill_worker(slot);
        return;
    }

    // The deadline runs from release
    slot.deadline = Clock::now() + timeout_;

    LOG_DEBUG("Released worker {} (pid {}) with a timeout of {}", slot.index, slot.pid, timeout_);
}

std::chrono::milliseconds SupervisorRun::next_poll_timeout() const {
    const auto now = Clock::now();
    auto timeout = MAX_POLL_INTERVAL;

    for (const Slot& slot : slots_) {
        if (slot.state != Slot::State::Running || slot.killed_by_supervisor) {
            continue;
        }

        auto until_deadline = std::chrono::ceil<std::chrono::milliseconds>(slot.deadline - now);
        timeout = std::clamp(until_deadline, std::chrono::milliseconds{0}, timeout);
    }

    return timeout;
}

void SupervisorRun::poll_events() {
    std::vector<pollfd> fds;
    std::vector<Capture*> captures;

    fds.push_back({.fd = signal_fd_, .events = POLLIN, .revents = 0});
    captures.push_back(nullptr);

    for (Slot& slot : slots_) {
        if (slot.state != Slot::State::Running) {
            continue;
        }

        for (Capture* capture : {&slot.out, &slot.err, &slot.frame}) {
            if (capture->is_open()) {
                fds.push_back({.fd = capture->fd, .events = POLLIN, .revents = 0});
                captures.push_back(capture);
            }
        }
    }

    auto poll_res = linux::poll(fds, next_poll_timeout());
    if (!poll_res) {
        // Not fatal: every worker is still swept for state changes below
        LOG_WARN("poll failed: {}", poll_res.error());
        return;
    }

    if (fds.front().revents != 0) {
        // Only used as a wakeup; the pending SIGCHLDs are discarded
        signalfd_siginfo info{};
        while (::read(signal_fd_, &info, sizeof(info)) == sizeof(info)) {
        }
    }

    for (std::size_t i = 1; i < fds.size(); ++i) {
        if (fds[i].revents != 0) {
            captures[i]->drain();
        }
    }
}

void SupervisorRun::service(Slot& slot) {
    // A complete frame means the task is done; the worker just idles now
    if (slot.frame_received() && !slot.killed_by_supervisor) {
        kill_worker(slot);
    }

    for (int i = 0; i < MAX_STOPS_PER_SWEEP && !slot.termination; ++i) {
        auto event = TracedWaitid::poll(slot.pid);

        if (!event) {
            LOG_ERROR("waitid on worker {} failed: {}", slot.pid, event.error());
            kill_worker(slot);
            return;
        }

        if (!event->has_event()) {
            return;
        }

        if (event->is_terminated()) {
            LOG_DEBUG("Worker {} (pid {}) terminated: {}", slot.index, slot.pid, *event);
            slot.termination = *event;
            return;
        }

        // Stops are irrelevant once the worker is being killed
        if (slot.killed_by_supervisor) {
            continue;
        }

        auto verdict = tracer_.handle_stop(slot.pid, *event, slot.trace);

        if (!verdict) {
            LOG_ERROR("Failed to handle stop of worker {}: {}", slot.pid, verdict.error());
            kill_worker(slot);
        } else if (verdict->has_value()) {
            LOG_WARN("Worker {} (pid {}) violated the capability policy: {}", slot.index, slot.pid, **verdict);
            slot.violation = std::move(*verdict.value());
            kill_worker(slot);
        }
    }
}

void SupervisorRun::enforce_deadline(Slot& slot, Clock::time_point now) {
    if (slot.termination || slot.killed_by_supervisor || now < slot.deadline) {
        return;
    }

    LOG_DEBUG("Worker {} (pid {}) exceeded its timeout of {}", slot.index, slot.pid, timeout_);
    slot.timed_out = true;
    kill_worker(slot);
}

void SupervisorRun::kill_worker(Slot& slot) {
    if (slot.killed_by_supervisor || slot.termination) {
        return;
    }

    slot.killed_by_supervisor = true;

    if (auto res = linux::kill(slot.pid, SIGKILL); !res) {
        LOG_ERROR("Could not kill worker {}: {}", slot.pid, res.error());
    }
}

void SupervisorRun::finish(Slot& slot) {
    // The worker is dead and nobody else holds the write ends, so this reaches EOF without blocking
    for (Capture* capture : {&slot.out, &slot.err, &slot.frame}) {
        capture->drain();
        capture->close();
    }

    if (slot.out.truncated || slot.err.truncated) {
        LOG_DEBUG("Output of worker {} was truncated to {} bytes per stream", slot.index, options_.max_output_bytes);
    }

    slot.state = Slot::State::Finished;
}

WorkerReport SupervisorRun::classify(Slot& slot) {
    WorkerReport report;
    report.stdout_text = std::move(slot.out.data);
    report.stderr_text = std::move(slot.err.data);

    auto fault = [&report](WorkerFault::Kind kind, std::string detail, std::optional<int> signal_num = std::nullopt) {
        report.status = WorkerReport::Status::Faulted;
        report.fault = WorkerFault{
            .kind = kind, .detail = std::move(detail), .signal_num = signal_num, .syscall_nr = std::nullopt};
    };

    const std::string& frame = slot.frame.data;

    if (slot.spawn_failure) {
        report.status = WorkerReport::Status::Faulted;
        report.fault = std::move(slot.spawn_failure);
    } else if (slot.timed_out) {
        report.status = WorkerReport::Status::TimedOut;
    } else if (!frame.empty() && frame.front() == RESULT_FRAME_TAG) {
        report.status = WorkerReport::Status::Completed;
        report.payload = frame.substr(1);
    } else if (slot.violation) {
        report.status = WorkerReport::Status::Faulted;
        report.fault = std::move(slot.violation);
    } else if (!frame.empty() && frame.front() == EXCEPTION_FRAME_TAG) {
        fault(WorkerFault::Kind::UncaughtException, frame.substr(1));
    } else if (!frame.empty()) {
        fault(WorkerFault::Kind::CorruptResult, fmt::format("unrecognized frame tag '{}'", frame.front()));
    } else if (slot.termination && slot.termination->type != CLD_EXITED && !slot.killed_by_supervisor &&
               slot.termination->signal_num) {
        int signal_num = *slot.termination->signal_num;
        fault(WorkerFault::Kind::Signaled, linux::Signal{signal_num}.to_string(), signal_num);
    } else if (slot.termination && slot.termination->exit_code) {
        fault(WorkerFault::Kind::NoResult, fmt::format("worker exited with status {}", *slot.termination->exit_code));
    } else {
        fault(WorkerFault::Kind::NoResult, "worker ended without reporting a result");
    }

    LOG_DEBUG("Worker {} finished: {}{}", slot.index, report.status,
              report.fault ? fmt::format(" ({})", *report.fault) : std::string{});

    return report;
}

} // namespace

WorkerSupervisor::WorkerSupervisor(std::chrono::milliseconds timeout, ExecutorOptions options)
    : timeout_{timeout}
    , options_{options} {}

std::vector<WorkerReport> WorkerSupervisor::run(std::span<const WorkerBody> bodies) {
    if (bodies.empty()) {
        return {};
    }

    const CapabilityPolicy* policy = CapabilityPolicy::installed();
    if (policy == nullptr) {
        policy = &CapabilityPolicy::install();
    }

    LOG_DEBUG("Running {} worker(s); timeout={}, max_parallel={}", bodies.size(), timeout_, options_.max_parallel);

    SupervisorRun supervisor_run{bodies, timeout_, options_, *policy};

    return DEBUG_TIME(supervisor_run.execute());
}

} // namespace sandtest
