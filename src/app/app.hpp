#pragma once

#include "app/trace_exception.hpp"
#include "user/program_options.hpp"

#include <bridgegrader/common/class_traits.hpp>

#include <optional>
#include <utility>

namespace bridgegrader {

/// Process exit codes of the command-line program
enum ExitCode : int {
    ALL_PASSED = 0,
    FAILED = 1,
    INTERNAL_ERROR = 2,
};

class App : NonCopyable
{
public:
    explicit App(ProgramOptions opts)
        : OPTS{std::move(opts)} {}

    virtual ~App() = default;

    const ProgramOptions& get_opts() const noexcept { return OPTS; }

    int run() noexcept {
        std::optional res = wrap_throwable_fn(&App::run_impl, this);

        return res.value_or(INTERNAL_ERROR);
    }

    const ProgramOptions OPTS;

protected:
    virtual int run_impl() = 0;
};

} // namespace bridgegrader
