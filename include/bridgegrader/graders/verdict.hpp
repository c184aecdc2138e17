#pragma once

#include <bridgegrader/checkers/checker_result.hpp>
#include <bridgegrader/config/handler_data.hpp>
#include <bridgegrader/config/judge_env.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

namespace bridgegrader {

/// Name of the checker that needs no second opinion after an interactor accepts
inline constexpr std::string_view STANDARD_CHECKER = "standard";

struct InteractorLimits
{
    std::chrono::duration<double> time;
    /// KiB
    std::int64_t memory;

    bool operator==(const InteractorLimits&) const = default;
};

/// Interactor limits for a submission time limit of `time_limit`: explicit limits from the
/// configuration win, otherwise the interactor gets the submission's time plus slack and the
/// judge's generator memory limit.
InteractorLimits compute_interactor_limits(const HandlerData& handler_data, std::chrono::duration<double> time_limit,
                                           const JudgeEnv& env);

/// Combine the interactor's verdict with the submission's outcome:
///  - any result flag on the submission fails the case,
///  - an accepting interactor defers to `secondary` unless `checker_name` is the standard checker,
///  - otherwise the interactor's verdict stands.
/// `secondary` is only invoked when deferred to.
CheckerResult reconcile_verdict(CheckerResult parsed, std::uint32_t result_flag, std::string_view checker_name,
                                const std::function<CheckerResult()>& secondary);

} // namespace bridgegrader
