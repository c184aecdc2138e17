#include <bridgegrader/graders/verdict.hpp>

#include <bridgegrader/logging.hpp>
#include <bridgegrader/result.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>
#include <utility>

namespace bridgegrader {

InteractorLimits compute_interactor_limits(const HandlerData& handler_data, std::chrono::duration<double> time_limit,
                                           const JudgeEnv& env) {
    InteractorLimits limits{
        .time = handler_data.time_limit.value_or(handler_data.preprocessing_time + time_limit),
        .memory = handler_data.memory_limit.value_or(env.generator_memory_limit),
    };

    LOG_DEBUG("Interactor limits: {:.3f}s, {}KiB", limits.time.count(), limits.memory);

    return limits;
}

CheckerResult reconcile_verdict(CheckerResult parsed, std::uint32_t result_flag, std::string_view checker_name,
                                const std::function<CheckerResult()>& secondary) {
    if (result_flag != CaseResult::AC) {
        return CheckerResult::fail();
    }

    if (parsed.passed && checker_name != STANDARD_CHECKER) {
        LOG_DEBUG("Interactor accepted, deferring to checker {:?}", checker_name);
        return secondary();
    }

    return parsed;
}

} // namespace bridgegrader
