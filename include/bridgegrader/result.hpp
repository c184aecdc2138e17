/// \file
/// Raw per-case execution outcome of a submission
#pragma once

#include <bridgegrader/common/extra_formatters.hpp>

#include <fmt/base.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace bridgegrader {

class CaseResult
{
public:
    /// Bits of the result-flag bitmask. `AC` is the absence of any bit. `IE` marks the case
    /// that an internal fault ended.
    enum Flag : std::uint32_t {
        AC = 0,
        WA = 1U << 0U,
        RTE = 1U << 1U,
        TLE = 1U << 2U,
        MLE = 1U << 3U,
        IR = 1U << 4U,
        OLE = 1U << 6U,
        IE = 1U << 30U,
    };

    /// Bits that are reported (first one wins) when describing a failure
    static constexpr Flag FLAG_PRECEDENCE[] = {IE, TLE, MLE, OLE, RTE, IR, WA};

    std::uint32_t result_flag = AC;

    /// Data the process under test produced that is to be checked. For interactive problems
    /// this is the interactor's log rather than the submission's stdout.
    std::string proc_output;

    std::chrono::duration<double> execution_time{};
    /// Peak resident memory, in KiB
    std::int64_t max_memory = 0;

    double points = 0;
    double total_points = 0;

    std::string feedback;
    std::string extended_feedback;

    bool passed() const noexcept { return result_flag == AC; }

    /// Short code of the most relevant set flag, e.g. "TLE"
    std::string_view get_main_code() const noexcept;

    static std::string_view flag_code(Flag flag) noexcept;
};

} // namespace bridgegrader

template <>
struct fmt::formatter<::bridgegrader::CaseResult> : ::bridgegrader::DebugFormatter
{
    auto format(const ::bridgegrader::CaseResult& from, format_context& ctx) const {
        return fmt::format_to(ctx.out(), "CaseResult{{{}, {:.3f}s, {}KiB, {}/{}}}", from.get_main_code(),
                              from.execution_time.count(), from.max_memory, from.points, from.total_points);
    }
};
