#include <bridgegrader/contrib/contrib_module.hpp>

#include <bridgegrader/logging.hpp>

#include <string>

namespace bridgegrader {

CheckerResult DefaultContrib::parse_return_code(const HelperRun& run) const {
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
    case WA:
        return {.passed = false,
                .points = 0,
                .feedback = std::string{run.feedback},
                .extended_feedback = std::string{run.extended_feedback}};
    default:
        raise_helper_error(run);
    }
}

} // namespace bridgegrader
