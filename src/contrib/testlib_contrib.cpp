#include <bridgegrader/contrib/contrib_module.hpp>

#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>

#include <cstdlib>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace bridgegrader {

std::optional<double> TestlibContrib::parse_partial_points(std::string_view stderr_output) {
    static const std::regex partial_re{R"(^points ([-+]?\d*\.?\d+))", std::regex::ECMAScript | std::regex::multiline};

    std::match_results<std::string_view::const_iterator> match;

    if (!std::regex_search(stderr_output.begin(), stderr_output.end(), match, partial_re)) {
        return std::nullopt;
    }

    // Out of range values saturate to infinity or zero instead of throwing; callers check the range
    return std::strtod(match[1].str().c_str(), nullptr);
}

CheckerResult TestlibContrib::parse_return_code(const HelperRun& run) const {
    const Process& proc = run.process;

    if (proc.signal() || proc.is_tle() || proc.is_mle()) {
        raise_helper_error(run);
    }

    switch (proc.return_code()) {
    case AC:
        return {.passed = true,
                .points = run.points,
                .feedback = std::string{run.feedback},
                .extended_feedback = std::string{run.extended_feedback}};

    case PARTIAL: {
        auto fraction = parse_partial_points(run.stderr_output);

        if (!fraction) {
            throw InternalError(fmt::format("invalid stderr for partial points: {:?}", run.stderr_output),
                                ErrorKind::ProcessFailure);
        }

        if (*fraction < 0 || *fraction > 1) {
            throw InternalError(fmt::format("invalid partial points: {}", *fraction), ErrorKind::ProcessFailure);
        }

        LOG_DEBUG("{} awarded {} of {} points", run.name, *fraction, run.points);

        return {.passed = true,
                .points = *fraction * run.points,
                .feedback = std::string{run.feedback},
                .extended_feedback = std::string{run.extended_feedback}};
    }

    case WA:
    case PE:
        return {.passed = false,
                .points = 0,
                .feedback = std::string{run.feedback},
                .extended_feedback = std::string{run.extended_feedback}};

    case IE:
        throw InternalError(fmt::format("{} failed assertion with message {} {}", run.name, run.feedback,
                                        run.extended_feedback),
                            ErrorKind::ProcessFailure);

    default:
        raise_helper_error(run);
    }
}

} // namespace bridgegrader
