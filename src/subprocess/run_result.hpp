#pragma once

#include <sandtest/common/formatters.hpp>

#include <fmt/format.h>

namespace sandtest {

/// How a child process ended
class RunResult
{
public:
    enum class Kind { Exited, Killed };

    static RunResult make_exited(int code);
    static RunResult make_killed(int signal_num);

    Kind get_kind() const;

    /// Exit status for Kind::Exited; terminating signal for Kind::Killed
    int get_code() const;

    bool is_success() const { return kind_ == Kind::Exited && code_ == 0; }

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace sandtest

FMT_SERIALIZE_ENUM(::sandtest::RunResult::Kind, Exited, Killed);

template <>
struct fmt::formatter<::sandtest::RunResult> : ::sandtest::DebugFormatter
{
    auto format(const ::sandtest::RunResult& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}({})", from.get_kind(), from.get_code());
    }
};
