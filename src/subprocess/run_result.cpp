#include <bridgegrader/subprocess/run_result.hpp>

#include <csignal>

#include <sys/wait.h>

namespace bridgegrader {

RunResult::RunResult(Kind kind, int code)
    : kind_{kind}
    , code_{code} {}

RunResult RunResult::make_exited(int code) {
    return {Kind::Exited, code};
}

RunResult RunResult::make_killed(int code) {
    return {Kind::Killed, code};
}

RunResult RunResult::make_signal_caught(int code) {
    return {Kind::SignalCaught, code};
}

RunResult RunResult::from_wait_status(int status) {
    if (WIFEXITED(status)) {
        return make_exited(WEXITSTATUS(status));
    }

    // SIGKILL cannot be handled, so it's the only one that is definitely not "caught"
    if (WTERMSIG(status) == SIGKILL) {
        return make_killed(SIGKILL);
    }

    return make_signal_caught(WTERMSIG(status));
}

RunResult::Kind RunResult::get_kind() const {
    return kind_;
}

int RunResult::get_code() const {
    return code_;
}

int RunResult::return_code() const {
    return kind_ == Kind::Exited ? code_ : -code_;
}

} // namespace bridgegrader
