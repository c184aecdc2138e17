#include "output/reporter.hpp"

#include <bridgegrader/judge.hpp>

#include <cstddef>

namespace bridgegrader {

void Reporter::report(const SubmissionReport& report) {
    on_submission_begin(report.problem_id, report.language);

    if (report.compile_error) {
        on_compile_error(*report.compile_error);
    }

    for (std::size_t i = 0; i < report.cases.size(); ++i) {
        on_case_result(i + 1, report.cases[i]);
    }

    if (report.internal_error) {
        on_internal_error(*report.internal_error);
    }

    on_summary(report);
    finalize();
}

} // namespace bridgegrader
