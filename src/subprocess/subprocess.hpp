#pragma once

#include "subprocess/run_result.hpp"

#include <sandtest/common/class_traits.hpp>
#include <sandtest/common/error_types.hpp>
#include <sandtest/common/linux.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>
#include <unistd.h>

namespace sandtest {

/// A child process running an external tool, with its standard streams connected to pipes
class Subprocess : NonCopyable
{
public:
    /// Prepares to run ``exec`` (searched for in PATH) with ``args``.
    /// ENV variables remain as default for for the child process.
    explicit Subprocess(std::string exec, std::vector<std::string> args);
    ~Subprocess();
    Subprocess(Subprocess&&) noexcept;
    Subprocess& operator=(Subprocess&&) noexcept;

    /// Forks the current process to start the subprocess
    Result<void> start();

    /// Sends ``input`` to the child's stdin, closes it, then collects stdout and stderr until
    /// the child exits.
    ///
    /// Both streams are drained concurrently with the stdin write, so a chatty child can never
    /// deadlock against us. On timeout, the child is killed and ErrorKind::TimedOut is returned.
    Result<RunResult> communicate(std::string_view input, std::chrono::milliseconds timeout);

    const std::string& get_stdout() const { return stdout_buffer_; }

    const std::string& get_stderr() const { return stderr_buffer_; }

    /// Whether child process is alive
    bool is_alive() const;

    pid_t get_pid() const { return child_pid_; }

    /// Manually kill subprocess with SIGKILL, and reap it
    Result<void> kill();

private:
    Result<void> create(const std::string& exec, const std::vector<std::string>& args);

    /// Only returns on failure, at which point the child must _exit
    Result<void> init_child();
    Result<void> init_parent();

    /// Blocks until the child is reaped
    Result<RunResult> reap();

    Result<void> close_pipes();

    pid_t child_pid_{};

    /// The parent process will only make use of the write end of stdin_pipe_, and the read ends of
    /// stdout_pipe_ and stderr_pipe_
    linux::Pipe stdin_pipe_{-1, -1};
    linux::Pipe stdout_pipe_{-1, -1};
    linux::Pipe stderr_pipe_{-1, -1};

    std::string stdout_buffer_;
    std::string stderr_buffer_;

    std::optional<RunResult> run_result_;

    std::string exec_;
    std::vector<std::string> args_;
};

} // namespace sandtest
