#pragma once

#include <sandtest/common/error_types.hpp>
#include <sandtest/common/formatters.hpp>

#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sandtest {

/// A unit of work run inside a sandbox worker
template <typename T>
using SandboxTask = std::function<T()>;

/// Specialize to let results of type T cross the worker boundary.
/// Must provide:
///   static std::string encode(const T&);
///   static Result<T> decode(std::string_view);
template <typename T>
struct TaskTransfer;

template <typename T>
concept Transferable = requires(const T& value, std::string_view encoded) {
    { TaskTransfer<T>::encode(value) } -> std::convertible_to<std::string>;
    { TaskTransfer<T>::decode(encoded) } -> std::same_as<Result<T>>;
};

/// Why a worker ended without a usable result
struct WorkerFault
{
    enum class Kind {
        SecurityViolation, ///< The worker attempted an operation the capability policy denies
        Signaled,          ///< The worker was killed by a signal it raised itself (SIGSEGV, SIGABRT, ...)
        UncaughtException, ///< The task body let an exception escape
        NoResult,          ///< The worker died without reporting anything
        CorruptResult,     ///< The reported result could not be decoded
        SpawnFailed,       ///< The worker could not be started
    };

    Kind kind;

    /// Human readable details: the denied operation, the exception description, ...
    std::string detail;

    /// Set for Kind::Signaled
    std::optional<int> signal_num;

    /// Set for Kind::SecurityViolation
    std::optional<long> syscall_nr; // NOLINT(google-runtime-int)
};

struct ExecutorOptions
{
    /// Maximum number of workers alive at once. 0 = one worker per task, all at once
    std::size_t max_parallel = 0;

    /// Cap on each captured stream (stdout and stderr, separately). Excess output is read and discarded
    std::size_t max_output_bytes = std::size_t{1} << 20;
};

} // namespace sandtest

FMT_SERIALIZE_ENUM(::sandtest::WorkerFault::Kind, SecurityViolation, Signaled, UncaughtException, NoResult,
                   CorruptResult, SpawnFailed);

template <>
struct fmt::formatter<::sandtest::WorkerFault> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::WorkerFault& from, format_context& ctx) const {
        if (from.detail.empty()) {
            return fmt::format_to(ctx.out(), "{}", from.kind);
        }
        return fmt::format_to(ctx.out(), "{}: {}", from.kind, from.detail);
    }
};
