#include <bridgegrader/judge.hpp>

#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/graders/bridged_grader.hpp>
#include <bridgegrader/graders/standard_grader.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/numeric/accumulate.hpp>

#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace bridgegrader {

double SubmissionReport::points() const {
    return ranges::accumulate(cases, 0.0, std::plus<>{}, &CaseResult::points);
}

double SubmissionReport::total_points() const {
    return ranges::accumulate(cases, 0.0, std::plus<>{}, &CaseResult::total_points);
}

bool SubmissionReport::all_passed() const {
    return !compile_error && !internal_error && cases.size() == total_cases &&
           ranges::all_of(cases, &CaseResult::passed);
}

Judge::Judge(JudgeEnv env)
    : env_{std::move(env)}
    , storage_{env_.problem_storage}
    , toolchain_{std::make_unique<CommandToolchain>(env_)} {}

std::unique_ptr<Grader> Judge::make_grader(const Problem& problem, const std::string& language,
                                           const std::string& source) const {
    if (problem.interactive) {
        return std::make_unique<BridgedInteractiveGrader>(env_, problem, language, source, *toolchain_, storage_);
    }

    return std::make_unique<StandardGrader>(env_, problem, language, source, *toolchain_, storage_);
}

SubmissionReport Judge::grade_submission(const std::string& problem_id, const std::string& storage_namespace,
                                         const std::string& language, const std::string& source) const {
    SubmissionReport report{.problem_id = problem_id, .language = language};

    try {
        const Problem problem = load_problem(storage_, problem_id, storage_namespace, env_);
        report.total_cases = problem.cases.size();

        auto grader = make_grader(problem, language, source);

        for (const TestCase& test_case : problem.cases) {
            try {
                report.cases.push_back(grader->grade(test_case));
            } catch (const InternalError& err) {
                // The case that hit the fault is reported as such; grading stops there
                report.cases.push_back(CaseResult{.result_flag = CaseResult::IE,
                                                  .total_points = test_case.points,
                                                  .feedback = err.what()});
                LOG_INFO("Case #{}: {}", test_case.position, report.cases.back());
                throw;
            }

            LOG_INFO("Case #{}: {}", test_case.position, report.cases.back());
        }
    } catch (const CompileError& err) {
        LOG_INFO("Submission to {:?} failed to compile: {}", problem_id, err.what());
        report.compile_error = err.get_output().empty() ? err.what() : err.get_output();
    } catch (const InternalError& err) {
        LOG_ERROR("Internal error while grading {:?}: {}", problem_id, err);
        report.internal_error = err.what();
    }

    return report;
}

} // namespace bridgegrader
