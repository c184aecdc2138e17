#include <bridgegrader/graders/standard_grader.hpp>

#include <bridgegrader/checkers/checker.hpp>
#include <bridgegrader/common/linux.hpp>
#include <bridgegrader/common/temp_file.hpp>
#include <bridgegrader/common/unique_fd.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>
#include <bridgegrader/registrars/checker_registrar.hpp>

#include <fmt/format.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <utility>

#include <fcntl.h>

namespace bridgegrader {

StandardGrader::StandardGrader(const JudgeEnv& env, const Problem& problem, std::string language, std::string source,
                               const Toolchain& toolchain, const ProblemStorage& storage)
    : Grader{env, problem, std::move(language), std::move(source), toolchain, storage}
    , binary_{compile_submission()} {}

Executable StandardGrader::compile_submission() const {
    const LanguageConfig& lang = env_.get_language(language_);

    auto staging = ScopedTempDir::create(env_.tempdir, "bridgegrader-src");
    if (!staging) {
        throw InternalError(fmt::format("could not stage submission source: {}", staging.error()),
                            ErrorKind::SyscallFailure);
    }

    const auto source_path = staging->path() / fmt::format("main{}", lang.extension);

    {
        std::ofstream file{source_path, std::ios::binary};
        file << source_;

        if (!file) {
            throw InternalError(fmt::format("could not write submission source to {}", source_path),
                                ErrorKind::SyscallFailure);
        }
    }

    return toolchain_.compile({source_path}, {}, language_, env_.compiler_time_limit, false);
}

CaseResult StandardGrader::grade(const TestCase& test_case) {
    CaseResult result;
    result.total_points = test_case.points;

    const std::string input = test_case.input_data();

    // Whatever happens, the submission doesn't outlive its case
    auto cleanup = gsl::finally([this] { current_proc_.reset(); });

    current_proc_ = launch_process(test_case);
    const std::string error = interact_with_process(test_case, result, input);

    populate_result(error, result);

    CheckerResult verdict = check_result(test_case, result);

    if (!verdict.passed) {
        result.result_flag |= CaseResult::WA;
    }

    result.points = verdict.points;

    if (!verdict.feedback.empty()) {
        result.feedback = std::move(verdict.feedback);
    }
    if (!verdict.extended_feedback.empty()) {
        result.extended_feedback = std::move(verdict.extended_feedback);
    }

    LOG_DEBUG("Case #{}: {}", test_case.position, result);

    return result;
}

std::unique_ptr<Process> StandardGrader::launch_process(const TestCase& test_case) {
    auto input_fd = linux::open(test_case.input_file.string(), O_RDONLY | O_CLOEXEC);

    if (!input_fd) {
        throw ConfigError(fmt::format("could not open input file {}: {}", test_case.input_file, input_fd.error()));
    }

    UniqueFd input{*input_fd};

    LaunchOptions opts;
    opts.time = problem_.time_limit;
    opts.memory = problem_.memory_limit;
    opts.wall_time = test_case.wall_time_factor * problem_.time_limit;
    opts.symlinks = test_case.symlinks;
    opts.stdin_stream = Stream::from_fd(input.get());
    opts.tempdir = env_.tempdir;

    // The child holds its own duplicate of the input once launched
    return binary_.launch({}, std::move(opts));
}

std::string StandardGrader::interact_with_process(const TestCase& /*test_case*/, CaseResult& result,
                                                  const std::string& /*input*/) {
    auto [output, error] = current_proc_->communicate();
    result.proc_output = std::move(output);

    return error;
}

void StandardGrader::populate_result(const std::string& error, CaseResult& result) const {
    ASSERT(current_proc_ != nullptr);
    const Process& proc = *current_proc_;

    result.result_flag |= proc.result_flags();
    result.execution_time = proc.execution_time();
    result.max_memory = proc.max_memory();

    if ((result.result_flag & CaseResult::RTE) != 0U) {
        if (auto sig = proc.signal()) {
            result.feedback = sig->name();
        }
    }

    if (!error.empty()) {
        LOG_DEBUG("Submission stderr: {:?}", error);
    }
}

CheckerResult StandardGrader::check_result(const TestCase& test_case, const CaseResult& result) {
    // A submission that already failed can't be correct, and checkers may be expensive
    if (!result.passed()) {
        return CheckerResult::fail();
    }

    const Checker& checker = CheckerRegistrar::get().get_checker(test_case.checker);

    return checker.check(result.proc_output, test_case.output_data(), test_case.points, test_case.input_data());
}

} // namespace bridgegrader
