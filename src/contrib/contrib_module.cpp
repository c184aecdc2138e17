#include <bridgegrader/contrib/contrib_module.hpp>

#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>

#include <optional>
#include <string>
#include <string_view>

namespace bridgegrader {

void ContribModule::raise_helper_error(const HelperRun& run) {
    const Process& proc = run.process;
    std::string error;

    if (proc.is_tle()) {
        error = fmt::format("{} timed out (> {} seconds)", run.name, run.time_limit.count());
    } else if (proc.is_mle()) {
        error = fmt::format("{} ran out of memory (> {} KiB)", run.name, run.memory_limit);
    } else if (auto sig = proc.signal()) {
        error = fmt::format("{} raised signal {}", run.name, sig->name());
    } else {
        error = fmt::format("{} exited with unexpected return code {}", run.name, proc.return_code());
    }

    if (!run.stderr_output.empty()) {
        error += fmt::format(" with stderr {:?}", run.stderr_output);
    }

    LOG_ERROR("Helper {} ({}) failed: {}", run.name, run.binary.get_command(), error);

    throw InternalError(error, ErrorKind::ProcessFailure);
}

const ContribModule& get_contrib_module(ContribType type) {
    static const DefaultContrib default_contrib;
    static const TestlibContrib testlib_contrib;

    switch (type) {
    case ContribType::Default:
        return default_contrib;
    case ContribType::Testlib:
        return testlib_contrib;
    }

    throw InternalError(fmt::format("unhandled contrib type {}", static_cast<int>(type)));
}

std::optional<ContribType> parse_contrib_type(std::string_view tag) {
    if (tag == "default") {
        return ContribType::Default;
    }

    if (tag == "testlib") {
        return ContribType::Testlib;
    }

    return std::nullopt;
}

} // namespace bridgegrader
