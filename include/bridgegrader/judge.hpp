#pragma once

#include <bridgegrader/config/judge_env.hpp>
#include <bridgegrader/config/problem.hpp>
#include <bridgegrader/executors/toolchain.hpp>
#include <bridgegrader/graders/grader.hpp>
#include <bridgegrader/result.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace bridgegrader {

/// Outcome of grading a whole submission
struct SubmissionReport
{
    std::string problem_id;
    std::string language;

    /// One entry per graded case, in order. Grading stops early on an internal error.
    std::vector<CaseResult> cases;
    /// Number of cases the problem has
    std::size_t total_cases = 0;

    std::optional<std::string> compile_error;
    std::optional<std::string> internal_error;

    double points() const;
    double total_points() const;

    /// Every case ran and passed
    bool all_passed() const;
};

/// Grades submissions against problems from the configured storage
class Judge
{
public:
    explicit Judge(JudgeEnv env);

    /// Never throws for contestant or judge faults; they are reported in the returned report
    SubmissionReport grade_submission(const std::string& problem_id, const std::string& storage_namespace,
                                      const std::string& language, const std::string& source) const;

    const JudgeEnv& get_env() const { return env_; }

    const ProblemStorage& get_storage() const { return storage_; }

private:
    std::unique_ptr<Grader> make_grader(const Problem& problem, const std::string& language,
                                        const std::string& source) const;

    JudgeEnv env_;
    ProblemStorage storage_;
    std::unique_ptr<Toolchain> toolchain_;
};

} // namespace bridgegrader
