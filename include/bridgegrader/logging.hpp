#pragma once

#include <bridgegrader/common/class_traits.hpp>
// Formatters for paths, optionals, error codes and described enums, so that any
// of them can be passed straight to the LOG_* macros
#include <bridgegrader/common/extra_formatters.hpp> // IWYU pragma: keep

#include <fmt/chrono.h>
#include <fmt/color.h>
#include <fmt/ranges.h>

#include <chrono>
#include <string_view>

// Compile-time log level. Must be set before spdlog is included.
#if defined(TRACE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(DEBUG)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#define SPDLOG_FUNCTION __PRETTY_FUNCTION__
#elif defined(RELEASE)
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#else
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#endif

#include <spdlog/cfg/env.h>
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_CRITICAL(__VA_ARGS__)

/// Evaluates `expr`, logging its wall-clock duration in debug builds
#ifdef DEBUG
#define DEBUG_TIME(expr)                                                                                               \
    [&]() {                                                                                                            \
        const ::bridgegrader::detail::ScopedStopwatch debug_time_stopwatch__{#expr};                                  \
        return expr;                                                                                                   \
    }()
#else
#define DEBUG_TIME(expr) (expr)
#endif

namespace bridgegrader {

namespace detail {

// NOLINTNEXTLINE(cppcoreguidelines-special-member-functions)
class ScopedStopwatch : NonMovable
{
public:
    explicit ScopedStopwatch(std::string_view what)
        : what_{what}
        , start_{std::chrono::steady_clock::now()} {}

    ~ScopedStopwatch() {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
        LOG_DEBUG("{} took {:.3f}s", what_, elapsed.count());
    }

private:
    std::string_view what_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail

/// Environment variable holding spdlog level overrides, e.g. LOG_LEVEL=debug
inline constexpr const char* LOG_LEVEL_ENV = "LOG_LEVEL";

/// Route all logging to stderr. Grading reports own stdout.
inline void init_loggers() {
    // Watchdog threads log too
    spdlog::drop("default");
    spdlog::set_default_logger(spdlog::stderr_color_mt("default"));

#if defined(TRACE)
    spdlog::set_level(spdlog::level::trace);
#elif defined(DEBUG)
    spdlog::set_level(spdlog::level::debug);
#elif defined(RELEASE)
    spdlog::set_level(spdlog::level::err);
#else
    spdlog::set_level(spdlog::level::info);
#endif

    spdlog::cfg::load_env_levels(LOG_LEVEL_ENV);

#if defined(DEBUG) || defined(TRACE)
    spdlog::set_pattern("[%T.%e] [%^%8l%$] [pid %6P] [%30!!@%20!s:%-4#] %v");
#else
    // [HH:MM:SS.ms] [ level  ] [pid 12345] message
    spdlog::set_pattern("[%T.%e] [%^%=8l%$] [pid %6P] %v");
#endif
}

} // namespace bridgegrader
