#include <bridgegrader/graders/bridged_grader.hpp>

#include <bridgegrader/common/temp_file.hpp>
#include <bridgegrader/common/unique_fd.hpp>
#include <bridgegrader/contrib/contrib_module.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/graders/interactor_args.hpp>
#include <bridgegrader/graders/verdict.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>

namespace bridgegrader {

namespace {

const HandlerData& require_interactive(const Problem& problem) {
    if (!problem.interactive) {
        throw ConfigError(fmt::format("problem {:?} has no interactive section", problem.id));
    }

    return *problem.interactive;
}

const ContribModule& resolve_contrib(const std::string& tag) {
    auto type = parse_contrib_type(tag);

    if (!type) {
        throw InternalError(fmt::format("{} is not a valid contrib module", tag), ErrorKind::BadConfig);
    }

    return get_contrib_module(*type);
}

Pipe make_case_pipe() {
    auto pipe = make_pipe(O_CLOEXEC);

    if (!pipe) {
        throw InternalError(fmt::format("could not create pipe: {}", pipe.error()), ErrorKind::SyscallFailure);
    }

    return std::move(pipe.value());
}

ScopedTempFile make_case_file(std::string_view contents, const std::filesystem::path& dir) {
    auto file = ScopedTempFile::create(contents, dir);

    if (!file) {
        throw InternalError(fmt::format("could not create temporary file in {}: {}", dir, file.error()),
                            ErrorKind::SyscallFailure);
    }

    return std::move(file.value());
}

} // namespace

BridgedInteractiveGrader::BridgedInteractiveGrader(const JudgeEnv& env, const Problem& problem, std::string language,
                                                   std::string source, const Toolchain& toolchain,
                                                   const ProblemStorage& storage)
    : StandardGrader{env, problem, std::move(language), std::move(source), toolchain, storage}
    , handler_data_{require_interactive(problem)}
    , interactor_binary_{generate_interactor_binary()}
    , contrib_{&resolve_contrib(handler_data_.type)} {
    LOG_DEBUG("Interactive grader for {:?} using the {} contrib module", problem.id, contrib_->get_type());

    // A bad argument template fails the submission before any case launches a process
    std::ignore = format_interactor_args(args_format(), "input", "output", "answer");
}

Executable BridgedInteractiveGrader::generate_interactor_binary() const {
    auto root = storage_.get_problem_root(problem_.id, problem_.storage_namespace);

    if (!root) {
        throw ConfigError(
            fmt::format("problem {:?} not found in storage namespace {:?}", problem_.id, problem_.storage_namespace));
    }

    std::vector<std::filesystem::path> files;
    for (const auto& file : handler_data_.files) {
        files.push_back(*root / file);
    }

    try {
        return toolchain_.compile(files, handler_data_.flags, handler_data_.lang, handler_data_.compiler_time_limit,
                                  handler_data_.unbuffered);
    } catch (const CompileError& err) {
        LOG_ERROR("Interactor failed compiling: {}\n{}", err.what(), err.get_output());
        throw InternalError(fmt::format("interactor failed compiling\n{}", err.get_output()),
                            ErrorKind::CompileFailure);
    }
}

std::string_view BridgedInteractiveGrader::args_format() const {
    if (handler_data_.args_format_string) {
        return *handler_data_.args_format_string;
    }

    return contrib_->interactor_args_format();
}

CaseResult BridgedInteractiveGrader::grade(const TestCase& test_case) {
    // Pipes, the interactor and temporary files all go away with the case, however it ends
    auto cleanup = gsl::finally([this] { context_.reset(); });

    return StandardGrader::grade(test_case);
}

std::unique_ptr<Process> BridgedInteractiveGrader::launch_process(const TestCase& test_case) {
    auto& ctx = context_.emplace();

    ctx.to_interactor = make_case_pipe();
    ctx.to_submission = make_case_pipe();

    LaunchOptions opts;
    opts.time = problem_.time_limit;
    opts.memory = problem_.memory_limit;
    opts.wall_time = test_case.wall_time_factor * problem_.time_limit;
    opts.symlinks = test_case.symlinks;
    opts.stdin_stream = Stream::from_fd(ctx.to_submission.read_end.get());
    opts.stdout_stream = Stream::from_fd(ctx.to_interactor.write_end.get());
    opts.tempdir = env_.tempdir;

    auto proc = binary_.launch({}, std::move(opts));

    // The submission has its own copies now
    ctx.to_submission.read_end.reset();
    ctx.to_interactor.write_end.reset();

    return proc;
}

std::string BridgedInteractiveGrader::interact_with_process(const TestCase& test_case, CaseResult& result,
                                                            const std::string& input) {
    ASSERT(context_.has_value(), "interact_with_process() called before launch_process()");
    auto& ctx = *context_;

    ctx.limits = compute_interactor_limits(handler_data_, problem_.time_limit, env_);

    const ScopedTempFile input_file = make_case_file(input, env_.tempdir);
    const ScopedTempFile answer_file = make_case_file(test_case.output_data(), env_.tempdir);

    // The interactor writes its log next to itself, in its private working directory
    const std::string log_name = random_name(8);

    auto args = format_interactor_args(args_format(), input_file.name(), log_name, answer_file.name());

    LaunchOptions opts;
    opts.time = ctx.limits.time;
    opts.memory = ctx.limits.memory;
    opts.stdin_stream = Stream::from_fd(ctx.to_interactor.read_end.get());
    opts.stdout_stream = Stream::from_fd(ctx.to_submission.write_end.get());
    opts.file_io_output = log_name;
    opts.tempdir = env_.tempdir;

    ctx.interactor = interactor_binary_.launch(args, std::move(opts));

    // From here on only the children hold pipe ends, so either side sees EOF when the other exits
    ctx.to_interactor.read_end.reset();
    ctx.to_submission.write_end.reset();

    auto [output, interactor_stderr] = ctx.interactor->communicate();
    result.proc_output = std::move(output);
    ctx.interactor_stderr = std::move(interactor_stderr);

    std::ignore = current_proc_->wait();

    return current_proc_->stderr_output();
}

CheckerResult BridgedInteractiveGrader::check_result(const TestCase& test_case, const CaseResult& result) {
    ASSERT(context_.has_value() && context_->interactor != nullptr);
    const auto& ctx = *context_;

    // The interactor's own failures take precedence over anything the submission did
    CheckerResult parsed = contrib_->parse_return_code(HelperRun{
        .process = *ctx.interactor,
        .binary = interactor_binary_,
        .points = test_case.points,
        .time_limit = ctx.limits.time,
        .memory_limit = ctx.limits.memory,
        .feedback = "",
        .extended_feedback = ctx.interactor_stderr,
        .name = "interactor",
        .stderr_output = ctx.interactor_stderr,
    });

    LOG_DEBUG("Interactor verdict for case #{}: {}", test_case.position, parsed);

    return reconcile_verdict(std::move(parsed), result.result_flag, test_case.checker,
                             [&] { return StandardGrader::check_result(test_case, result); });
}

} // namespace bridgegrader
