#pragma once

#include <bridgegrader/common/class_traits.hpp>
#include <bridgegrader/config/judge_env.hpp>
#include <bridgegrader/config/problem.hpp>
#include <bridgegrader/executors/toolchain.hpp>
#include <bridgegrader/result.hpp>

#include <string>
#include <utility>

namespace bridgegrader {

/// Grades one submission to one problem, case by case.
/// Everything passed in by reference must outlive the grader.
class Grader : NonMovable
{
public:
    Grader(const JudgeEnv& env, const Problem& problem, std::string language, std::string source,
           const Toolchain& toolchain, const ProblemStorage& storage)
        : env_{env}
        , problem_{problem}
        , language_{std::move(language)}
        , source_{std::move(source)}
        , toolchain_{toolchain}
        , storage_{storage} {}

    virtual ~Grader() = default;

    /// Run the submission on a single case.
    /// Contestant failures are reported through the result; judge faults throw InternalError.
    virtual CaseResult grade(const TestCase& test_case) = 0;

    const Problem& get_problem() const { return problem_; }

    const std::string& get_language() const { return language_; }

protected:
    const JudgeEnv& env_;
    const Problem& problem_;
    std::string language_;
    std::string source_;
    const Toolchain& toolchain_;
    const ProblemStorage& storage_;
};

} // namespace bridgegrader
