#include <bridgegrader/executors/executable.hpp>

#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace bridgegrader {

Executable::Executable(std::vector<std::string> command, std::string language,
                       std::shared_ptr<const ScopedTempDir> build_dir)
    : command_{std::move(command)}
    , language_{std::move(language)}
    , build_dir_{std::move(build_dir)} {
    ASSERT(!command_.empty());
    ASSERT(build_dir_ != nullptr);
}

std::unique_ptr<Process> Executable::launch(const std::vector<std::string>& args, LaunchOptions opts) const {
    std::vector<std::string> argv = command_;
    argv.insert(argv.end(), args.begin(), args.end());

    auto proc = std::make_unique<Process>(std::move(argv), std::move(opts));

    if (auto res = proc->start(); !res) {
        throw InternalError(fmt::format("could not launch {}: {}", command_.back(), res.error()),
                            ErrorKind::ProcessFailure);
    }

    return proc;
}

} // namespace bridgegrader
