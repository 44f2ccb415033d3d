#include "subprocess/run_result.hpp"

namespace sandtest {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int signal_num) {
    return {Kind::Killed, signal_num};
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

} // namespace sandtest
