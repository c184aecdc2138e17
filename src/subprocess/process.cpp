#include <bridgegrader/subprocess/process.hpp>

#include <bridgegrader/common/error_types.hpp>
#include <bridgegrader/common/expected.hpp>
#include <bridgegrader/common/linux.hpp>
#include <bridgegrader/common/temp_file.hpp>
#include <bridgegrader/common/unique_fd.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/logging.hpp>
#include <bridgegrader/result.hpp>
#include <bridgegrader/subprocess/run_result.hpp>

#include <fmt/ranges.h>
#include <gsl/util>
#include <libassert/assert.hpp>

#include <cerrno>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <linux/close_range.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace bridgegrader {

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 64UL * 1024;

/// Reads everything from the start of `fd`, keeping at most `limit` bytes.
/// Returns the data and whether more than `limit` bytes were available.
Expected<std::pair<std::string, bool>> read_capped(int fd, std::size_t limit) {
    TRY(linux::lseek(fd, 0, SEEK_SET));

    std::string data;
    while (data.size() <= limit) {
        auto chunk = TRY(linux::read(fd, READ_CHUNK_SIZE));

        if (chunk.empty()) {
            return std::pair{std::move(data), false};
        }

        data += chunk;
    }

    data.resize(limit);
    return std::pair{std::move(data), true};
}

rlim_t to_cpu_rlimit(std::chrono::duration<double> time) {
    if (time <= std::chrono::duration<double>::zero()) {
        return 0;
    }

    // RLIMIT_CPU has a granularity of seconds; the precise check happens against rusage
    return static_cast<rlim_t>(std::ceil(time.count()));
}

/// The address space cap sits this far above the memory limit. Programs whose peak resident
/// memory passes the limit are flagged MLE; the cap only stops runaway allocation.
constexpr rlim_t ADDRESS_SPACE_FACTOR = 2;

} // namespace

Process::Process(std::vector<std::string> args, LaunchOptions opts)
    : args_{std::move(args)}
    , opts_{std::move(opts)} {
    ASSERT(!args_.empty(), "A process needs at least an executable path");
}

Process::~Process() {
    // child_pid_ == 0 -> never started
    if (child_pid_ <= 0 || run_result_) {
        return;
    }

    kill();

    try {
        std::ignore = wait();
    } catch (const InternalError& err) {
        LOG_ERROR("Could not reap {:?} (pid {}): {}", args_[0], child_pid_, err.what());
    }
}

std::chrono::duration<double> Process::effective_wall_time() const {
    if (opts_.wall_time) {
        return *opts_.wall_time;
    }

    return 3 * opts_.time;
}

Result<void> Process::prepare_child_resources() {
    // Every child gets its own scratch directory as working directory, which is where
    // symlinks and file_io output live
    working_dir_ = TRYE(ScopedTempDir::create(opts_.tempdir, "bridgegrader-run"), SyscallFailure);

    for (const auto& [name, target] : opts_.symlinks) {
        std::error_code err;
        std::filesystem::create_symlink(target, working_dir_->path() / name, err);

        if (err) {
            LOG_WARN("Could not create symlink {:?} -> {:?}: {}", name, target, err);
            return ErrorKind::SyscallFailure;
        }
    }

    if (opts_.stdout_stream.mode == Stream::Capture) {
        stdout_capture_.reset(TRYE(linux::memfd_create("stdout"), SyscallFailure));
    }

    if (opts_.stderr_stream.mode == Stream::Capture) {
        stderr_capture_.reset(TRYE(linux::memfd_create("stderr"), SyscallFailure));
    }

    return {};
}

Result<void> Process::start() {
    ASSERT(child_pid_ == 0, "Process was already started", args_);

    TRY(prepare_child_resources());

    // Everything the child needs is allocated here, before forking
    const linux::CStringArray argv{args_};
    const linux::CStringArray envp{opts_.env};
    const std::string working_dir = working_dir_->path().string();

    Pipe err_pipe = TRYE(make_pipe(O_CLOEXEC), SyscallFailure);

    start_time_ = std::chrono::steady_clock::now();
    auto fork_res = TRYE(linux::fork(), SyscallFailure);

    if (fork_res.which == linux::Fork::Child) {
        exec_child(argv, envp, working_dir, err_pipe.write_end.get());
    }

    child_pid_ = fork_res.pid;
    err_pipe.write_end.reset();

    if (auto pidfd = linux::pidfd_open(child_pid_); pidfd) {
        pidfd_.reset(*pidfd);
    } else {
        LOG_ERROR("Could not obtain a pidfd for {:?}: {}", args_[0], pidfd.error());
        std::ignore = linux::kill(child_pid_, SIGKILL);
        std::ignore = linux::wait4(child_pid_);
        run_result_ = RunResult::make_killed(SIGKILL);
        return ErrorKind::SyscallFailure;
    }

    // The error pipe is closed by a successful exec, so EOF here means the program is running
    auto report = TRYE(linux::read(err_pipe.read_end.get(), sizeof(int)), SyscallFailure);

    if (report.size() == sizeof(int)) {
        int child_errno = 0;
        std::memcpy(&child_errno, report.data(), sizeof(int));

        LOG_WARN("Failed to start {:?}: {}", args_[0], linux::make_error_code(child_errno));
        std::ignore = wait();

        return ErrorKind::ProcessFailure;
    }

    watchdog_ = std::jthread{[this] { watchdog(); }};

    LOG_DEBUG("Started {} (pid {}) with time={:.3f}s wall={:.3f}s memory={}KiB", args_, child_pid_,
              opts_.time.count(), effective_wall_time().count(), opts_.memory);

    return {};
}

void Process::exec_child(const linux::CStringArray& argv, const linux::CStringArray& envp,
                         const std::string& working_dir, int err_fd) const {
    const auto fail = [err_fd](int err) {
        std::ignore = ::write(err_fd, &err, sizeof(err));
        ::_exit(127);
    };

    // Own process group, so that anything the child spawns can be killed along with it
    ::setpgid(0, 0);
    ::prctl(PR_SET_PDEATHSIG, SIGKILL);

    const auto wire = [&](const Stream& stream, int capture_fd, int target, int null_flags) {
        int source = -1;

        switch (stream.mode) {
        case Stream::Fd:
            source = stream.fd;
            break;
        case Stream::Capture:
            source = capture_fd;
            break;
        case Stream::Null:
            // NOLINTNEXTLINE(*vararg)
            source = ::open("/dev/null", null_flags | O_CLOEXEC);
            break;
        }

        if (source == -1) {
            fail(errno == 0 ? EBADF : errno);
        }

        if (!linux::dup2(source, target)) {
            fail(errno);
        }
    };

    // stdin can't be captured
    wire(opts_.stdin_stream, -1, STDIN_FILENO, O_RDONLY);
    wire(opts_.stdout_stream, stdout_capture_.get(), STDOUT_FILENO, O_WRONLY);
    wire(opts_.stderr_stream, stderr_capture_.get(), STDERR_FILENO, O_WRONLY);

    // Anything inherited without O_CLOEXEC beyond the standard streams must not reach the program
    // NOLINTNEXTLINE(*vararg)
    ::syscall(SYS_close_range, 3U, ~0U, CLOSE_RANGE_CLOEXEC);

    if (!linux::chdir(working_dir)) {
        fail(errno);
    }

    const auto address_space = static_cast<rlim_t>(opts_.memory) * 1024 * ADDRESS_SPACE_FACTOR;

    if (!linux::setrlimit(RLIMIT_CPU, to_cpu_rlimit(opts_.time)) || !linux::setrlimit(RLIMIT_AS, address_space)) {
        fail(errno);
    }

    struct ::rlimit no_core {
        .rlim_cur = 0, .rlim_max = 0
    };
    ::setrlimit(RLIMIT_CORE, &no_core);

    fail(linux::execve(argv, envp).value());

    // unreachable, fail never returns
    ::_exit(127);
}

void Process::watchdog() {
    using namespace std::chrono_literals;
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    using std::chrono::steady_clock;

    const auto limit = effective_wall_time();
    const auto deadline = start_time_ + duration_cast<steady_clock::duration>(limit);

    while (true) {
        int timeout_ms = -1;

        // zero wall time means there is no deadline
        if (limit > 0s) {
            const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());

            if (remaining <= 0ms) {
                wall_timed_out_ = true;
                LOG_DEBUG("{:?} (pid {}) exceeded its wall time of {:.3f}s, killing it", args_[0], child_pid_,
                          limit.count());
                kill_group();
                return;
            }

            timeout_ms = gsl::narrow_cast<int>(remaining.count()) + 1;
        }

        auto exited = linux::poll_one(pidfd_.get(), POLLIN, timeout_ms);

        if (!exited) {
            if (exited.error() == std::errc::interrupted) {
                continue;
            }

            LOG_WARN("Watchdog of {:?} (pid {}) stopped: {}", args_[0], child_pid_, exited.error());
            return;
        }

        if (*exited) {
            return;
        }
    }
}

void Process::kill_group() noexcept {
    std::ignore = linux::pidfd_send_signal(pidfd_.get(), SIGKILL);

    // The leader is not reaped yet, so its pid still names this process group
    ::kill(-child_pid_, SIGKILL);
}

void Process::kill() {
    if (child_pid_ <= 0 || run_result_) {
        return;
    }

    kill_group();
}

RunResult Process::wait() {
    if (run_result_) {
        return *run_result_;
    }

    ASSERT(child_pid_ > 0, "Process was never started", args_);

    // Block until the child exits, but leave it unreaped until the watchdog is gone,
    // so that nothing can signal a recycled pid
    while (pidfd_) {
        auto exited = linux::poll_one(pidfd_.get(), POLLIN, -1);

        if (exited && *exited) {
            break;
        }

        if (!exited && exited.error() != std::errc::interrupted) {
            LOG_WARN("Polling {:?} (pid {}) for exit failed: {}", args_[0], child_pid_, exited.error());
            break;
        }
    }

    if (watchdog_.joinable()) {
        watchdog_.join();
    }

    // Processes the child left behind in its group would otherwise keep pipe ends open
    ::kill(-child_pid_, SIGKILL);

    auto status = linux::wait4(child_pid_);

    if (!status) {
        throw InternalError{fmt::format("could not reap {} (pid {}): {}", args_[0], child_pid_, status.error()),
                            ErrorKind::SyscallFailure};
    }

    wall_elapsed_ = std::chrono::steady_clock::now() - start_time_;

    const auto& usage = status->usage;
    const auto to_duration = [](const ::timeval& tv) {
        return std::chrono::duration<double>{static_cast<double>(tv.tv_sec) + static_cast<double>(tv.tv_usec) / 1e6};
    };
    cpu_time_ = to_duration(usage.ru_utime) + to_duration(usage.ru_stime);
    // ru_maxrss is in KiB on Linux
    max_memory_ = usage.ru_maxrss;

    run_result_ = RunResult::from_wait_status(status->status);
    pidfd_.reset();

    collect_outputs();

    LOG_DEBUG("{:?} (pid {}) finished: {} cpu={:.3f}s wall={:.3f}s mem={}KiB", args_[0], child_pid_, *run_result_,
              cpu_time_.count(), wall_elapsed_.count(), max_memory_);

    return *run_result_;
}

void Process::collect_outputs() {
    if (stderr_capture_) {
        if (auto res = read_capped(stderr_capture_.get(), opts_.output_limit); res) {
            stderr_ = std::move(res->first);
        } else {
            LOG_WARN("Could not read stderr of {:?}: {}", args_[0], res.error());
        }

        stderr_capture_.reset();
    }

    if (opts_.file_io_output) {
        const auto path = working_dir_->path() / *opts_.file_io_output;
        auto file = linux::open(path.string(), O_RDONLY | O_CLOEXEC);

        if (file) {
            UniqueFd owned{*file};

            if (auto res = read_capped(owned.get(), opts_.output_limit); res) {
                output_ = std::move(res->first);
            } else {
                LOG_WARN("Could not read output file {} of {:?}: {}", path, args_[0], res.error());
            }
        } else {
            LOG_DEBUG("{:?} did not create its output file {}", args_[0], path);
        }
    } else if (stdout_capture_) {
        if (auto res = read_capped(stdout_capture_.get(), opts_.output_limit); res) {
            output_ = std::move(res->first);
            output_truncated_ = res->second;
        } else {
            LOG_WARN("Could not read stdout of {:?}: {}", args_[0], res.error());
        }
    }

    stdout_capture_.reset();

    // Nothing of the run is needed on disk anymore
    working_dir_.reset();
}

std::pair<std::string, std::string> Process::communicate() {
    std::ignore = wait();

    return {output_, stderr_};
}

bool Process::is_tle() const {
    if (wall_timed_out_) {
        return true;
    }

    if (opts_.time > std::chrono::duration<double>::zero() && cpu_time_ > opts_.time) {
        return true;
    }

    return signal() == SIGXCPU;
}

bool Process::is_mle() const {
    return opts_.memory > 0 && max_memory_ > opts_.memory;
}

bool Process::is_ole() const {
    return output_truncated_;
}

bool Process::is_rte() const {
    return signal().has_value() && !is_tle() && !is_mle();
}

bool Process::is_ir() const {
    return run_result_ && run_result_->get_kind() == RunResult::Kind::Exited && run_result_->get_code() != 0;
}

int Process::return_code() const {
    DEBUG_ASSERT(run_result_.has_value(), "return_code() called before wait()");

    return run_result_ ? run_result_->return_code() : 0;
}

std::optional<linux::Signal> Process::signal() const {
    if (!run_result_ || run_result_->get_kind() == RunResult::Kind::Exited) {
        return std::nullopt;
    }

    return linux::Signal{run_result_->get_code()};
}

std::uint32_t Process::result_flags() const {
    std::uint32_t flags = CaseResult::AC;

    if (is_tle()) {
        flags |= CaseResult::TLE;
    }
    if (is_mle()) {
        flags |= CaseResult::MLE;
    }
    if (is_ole()) {
        flags |= CaseResult::OLE;
    }
    if (is_rte()) {
        flags |= CaseResult::RTE;
    }
    if (is_ir()) {
        flags |= CaseResult::IR;
    }

    return flags;
}

} // namespace bridgegrader
