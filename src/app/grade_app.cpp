#include "app/grade_app.hpp"

#include "output/plaintext_reporter.hpp"
#include "output/stdout_sink.hpp"
#include "user/program_options.hpp"

#include <bridgegrader/config/judge_env.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/judge.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace bridgegrader {

int GradeApp::exit_code_for(const SubmissionReport& report) {
    if (report.internal_error) {
        return INTERNAL_ERROR;
    }

    return report.all_passed() ? ALL_PASSED : FAILED;
}

JudgeEnv GradeApp::load_env() const {
    JudgeEnv env = OPTS.config_path ? JudgeEnv::load(*OPTS.config_path) : JudgeEnv{};

    auto& roots = env.problem_storage[OPTS.storage_namespace];
    roots.insert(roots.end(), OPTS.problem_roots.begin(), OPTS.problem_roots.end());

    LOG_DEBUG("Problem roots for namespace {:?}: {}", OPTS.storage_namespace, roots);

    return env;
}

std::string GradeApp::read_source() const {
    std::ifstream file{OPTS.source_path, std::ios::binary};

    if (!file) {
        throw InternalError(fmt::format("could not open source file {}", OPTS.source_path),
                            ErrorKind::SyscallFailure);
    }

    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

int GradeApp::run_impl() {
    StdoutSink output_sink;
    PlainTextReporter reporter{output_sink, OPTS.colorize_option, OPTS.verbosity};

    SubmissionReport report;

    try {
        const Judge judge{load_env()};

        report = judge.grade_submission(OPTS.problem_id, OPTS.storage_namespace, OPTS.language, read_source());
    } catch (const InternalError& err) {
        // Judge setup faults happen before any grading starts
        LOG_ERROR("Could not set up the judge: {}", err);

        report.problem_id = OPTS.problem_id;
        report.language = OPTS.language;
        report.internal_error = err.what();
    }

    reporter.report(report);

    return exit_code_for(report);
}

} // namespace bridgegrader
