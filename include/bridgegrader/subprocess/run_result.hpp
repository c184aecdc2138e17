#pragma once

#include <bridgegrader/common/extra_formatters.hpp>

#include <boost/describe/enum.hpp>
#include <fmt/base.h>
#include <fmt/format.h>

namespace bridgegrader {

/// How a child process ended
class RunResult
{
public:
    enum class Kind { Exited, Killed, SignalCaught };
    BOOST_DESCRIBE_NESTED_ENUM(Kind, Exited, Killed, SignalCaught);

    static RunResult make_exited(int code);
    static RunResult make_killed(int code);
    static RunResult make_signal_caught(int code);

    /// Decode a raw status as reported by wait(2)
    static RunResult from_wait_status(int status);

    Kind get_kind() const;

    /// Exit code for `Exited`, signal number otherwise
    int get_code() const;

    /// Exit code if the process exited normally, otherwise the negated signal number
    int return_code() const;

    bool operator==(const RunResult&) const = default;

private:
    RunResult(Kind kind, int code);

    Kind kind_;
    int code_;
};

} // namespace bridgegrader

template <>
struct fmt::formatter<::bridgegrader::RunResult> : ::bridgegrader::DebugFormatter
{
    auto format(const ::bridgegrader::RunResult& from, format_context& ctx) const {
        return format_to(ctx.out(), "{}({})", from.get_kind(), from.get_code());
    }
};
