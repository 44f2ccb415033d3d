#pragma once

#include <sandtest/common/class_traits.hpp>
#include <sandtest/common/formatters.hpp>

#include <fmt/format.h>

#include <bitset>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include <sys/types.h>

namespace sandtest {

enum class SyscallCategory {
    Termination, ///< Ending the process or signalling others (exit, exit_group, kill, ...)
    Creation,    ///< Threads and processes (clone, fork, execve, ...)
    Filesystem,  ///< Opening, creating or modifying paths
    Network,     ///< Sockets
    Escape,      ///< Anything that could loosen the sandbox (ptrace, setuid, prctl, seccomp, ...)
};

/// Which categories are denied to sandbox workers
struct PolicyOptions
{
    bool deny_termination = true;
    bool deny_creation = true;
    bool deny_filesystem = true;
    bool deny_network = true;
    bool deny_escape = true;

    bool denies(SyscallCategory category) const;

    bool operator==(const PolicyOptions& rhs) const = default;
};

/// Process-wide, immutable set of operations denied to sandbox workers.
///
/// Installed once; never torn down. The host process and its threads are not affected by the
/// policy: it is only consulted by the executor while tracing its workers.
class CapabilityPolicy : NonMovable
{
public:
    /// System calls numbered at or past this are always denied
    static constexpr std::size_t MAX_SYSCALL_NR = 1024;

    /// Installs the policy if none is installed yet, and returns the installed instance.
    /// Thread-safe; the first call wins. A later call with different ``options`` only logs a warning.
    static const CapabilityPolicy& install(PolicyOptions options = {});

    /// The installed policy, or nullptr before the first install
    static const CapabilityPolicy* installed();

    /// Whether a worker may execute system call ``syscall_nr`` (native ABI)
    bool permits(long syscall_nr) const noexcept; // NOLINT(google-runtime-int)

    /// As permits(), but also judges the call's arguments as seen at syscall entry.
    /// A denied tgkill is still allowed when ``caller`` targets itself, as raise() and abort() do.
    // NOLINTNEXTLINE(google-runtime-int)
    bool permits_call(long syscall_nr, std::span<const std::uint64_t> args, pid_t caller) const noexcept;

    /// Category of ``syscall_nr`` if it is in the deny table, regardless of options
    static std::optional<SyscallCategory> category_of(long syscall_nr); // NOLINT(google-runtime-int)

    /// A human readable name, e.g. "exit_group" or "syscall 999"
    static std::string describe(long syscall_nr); // NOLINT(google-runtime-int)

    const PolicyOptions& get_options() const { return options_; }

    std::size_t num_denied() const { return denied_.count(); }

private:
    explicit CapabilityPolicy(PolicyOptions options);

    PolicyOptions options_;
    std::bitset<MAX_SYSCALL_NR> denied_;
};

} // namespace sandtest

FMT_SERIALIZE_ENUM(::sandtest::SyscallCategory, Termination, Creation, Filesystem, Network, Escape);

template <>
struct fmt::formatter<::sandtest::PolicyOptions> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::PolicyOptions& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(),
                              "PolicyOptions{{termination={}, creation={}, filesystem={}, network={}, escape={}}}",
                              from.deny_termination, from.deny_creation, from.deny_filesystem, from.deny_network,
                              from.deny_escape);
    }
};
