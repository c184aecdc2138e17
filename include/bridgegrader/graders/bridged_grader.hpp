#pragma once

#include <bridgegrader/checkers/checker_result.hpp>
#include <bridgegrader/config/handler_data.hpp>
#include <bridgegrader/contrib/contrib_module.hpp>
#include <bridgegrader/executors/executable.hpp>
#include <bridgegrader/graders/interaction_context.hpp>
#include <bridgegrader/graders/standard_grader.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace bridgegrader {

/// Grades problems where the submission talks to an interactor over a pair of pipes.
/// The interactor's exit status decides the case, possibly followed by a secondary checker
/// over the interactor's log.
class BridgedInteractiveGrader : public StandardGrader
{
public:
    /// Compiles the submission and the interactor. Throws CompileError if the submission
    /// doesn't compile and InternalError if the interactor doesn't, or if its contrib type is unknown.
    BridgedInteractiveGrader(const JudgeEnv& env, const Problem& problem, std::string language, std::string source,
                             const Toolchain& toolchain, const ProblemStorage& storage);

    CaseResult grade(const TestCase& test_case) override;

    /// Build the interactor from the problem's configuration
    Executable generate_interactor_binary() const;

    const Executable& get_interactor_binary() const { return interactor_binary_; }

    const ContribModule& get_contrib_module() const { return *contrib_; }

protected:
    std::unique_ptr<Process> launch_process(const TestCase& test_case) override;

    std::string interact_with_process(const TestCase& test_case, CaseResult& result, const std::string& input) override;

    CheckerResult check_result(const TestCase& test_case, const CaseResult& result) override;

private:
    std::string_view args_format() const;

    HandlerData handler_data_;
    Executable interactor_binary_;
    const ContribModule* contrib_;

    std::optional<InteractionContext> context_;
};

} // namespace bridgegrader
