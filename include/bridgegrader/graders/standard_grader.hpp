#pragma once

#include <bridgegrader/checkers/checker_result.hpp>
#include <bridgegrader/executors/executable.hpp>
#include <bridgegrader/graders/grader.hpp>
#include <bridgegrader/result.hpp>
#include <bridgegrader/subprocess/process.hpp>

#include <memory>
#include <string>

namespace bridgegrader {

/// Feeds each case's input to the submission and judges its output with the case's checker.
///
/// `grade` drives three hooks that subclasses may replace:
///   launch_process        - start the submission
///   interact_with_process - feed it and collect its output into the result
///   check_result          - turn the collected output into a verdict
class StandardGrader : public Grader
{
public:
    /// Compiles the submission; throws CompileError if that fails
    StandardGrader(const JudgeEnv& env, const Problem& problem, std::string language, std::string source,
                   const Toolchain& toolchain, const ProblemStorage& storage);

    CaseResult grade(const TestCase& test_case) override;

    const Executable& get_binary() const { return binary_; }

protected:
    virtual std::unique_ptr<Process> launch_process(const TestCase& test_case);

    /// Returns the submission's stderr
    virtual std::string interact_with_process(const TestCase& test_case, CaseResult& result, const std::string& input);

    virtual CheckerResult check_result(const TestCase& test_case, const CaseResult& result);

    /// Fill in resource usage and failure flags of the finished submission
    void populate_result(const std::string& error, CaseResult& result) const;

    Executable binary_;

    /// The submission process of the case being graded
    std::unique_ptr<Process> current_proc_;

private:
    Executable compile_submission() const;
};

} // namespace bridgegrader
