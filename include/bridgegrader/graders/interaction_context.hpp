#pragma once

#include <bridgegrader/common/class_traits.hpp>
#include <bridgegrader/common/unique_fd.hpp>
#include <bridgegrader/graders/verdict.hpp>
#include <bridgegrader/subprocess/process.hpp>

#include <memory>
#include <string>

namespace bridgegrader {

/// State of one interactive case. Created when the case starts and destroyed when it ends;
/// destroying it closes any pipe end still held and kills an interactor that is still running.
struct InteractionContext : NonMovable
{
    /// submission stdout -> interactor stdin
    Pipe to_interactor;
    /// interactor stdout -> submission stdin
    Pipe to_submission;

    std::unique_ptr<Process> interactor;
    InteractorLimits limits{};
    std::string interactor_stderr;
};

} // namespace bridgegrader
