#pragma once

#include <bridgegrader/config/judge_env.hpp>

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace bridgegrader {

/// The `interactive` section of a problem configuration, with all defaults applied
struct HandlerData
{
    /// Interactor sources, relative to the problem root
    std::vector<std::string> files;
    std::vector<std::string> flags;
    std::string lang;
    std::chrono::duration<double> compiler_time_limit{10};
    bool unbuffered = true;

    /// Overrides the contrib module's interactor argument template
    std::optional<std::string> args_format_string;

    /// Slack given to the interactor on top of the submission's time limit
    std::chrono::duration<double> preprocessing_time{2};

    /// Explicit interactor limits, replacing the computed ones
    std::optional<std::chrono::duration<double>> time_limit;
    /// KiB
    std::optional<std::int64_t> memory_limit;

    /// Contrib module tag, resolved by the grader
    std::string type = "default";

    /// Throws ConfigError for missing or malformed fields. `env` supplies judge-wide defaults.
    static HandlerData parse(const nlohmann::json& json, const JudgeEnv& env);
};

} // namespace bridgegrader
