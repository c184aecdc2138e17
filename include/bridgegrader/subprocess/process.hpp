#pragma once

#include <bridgegrader/common/class_traits.hpp>
#include <bridgegrader/common/error_types.hpp>
#include <bridgegrader/common/linux.hpp>
#include <bridgegrader/common/temp_file.hpp>
#include <bridgegrader/common/unique_fd.hpp>
#include <bridgegrader/subprocess/run_result.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace bridgegrader {

/// Where one of the child's standard streams goes
struct Stream
{
    enum Mode { Null, Fd, Capture } mode = Null;

    /// Only meaningful for `Fd`. The fd is not owned; the child gets a duplicate.
    int fd = -1;

    static Stream null() { return {}; }

    static Stream from_fd(int fd) { return {.mode = Fd, .fd = fd}; }

    static Stream capture() { return {.mode = Capture}; }
};

/// Resource limits and stream wiring for a single child process
struct LaunchOptions
{
    /// CPU time limit; zero means unlimited
    std::chrono::duration<double> time{};

    /// Memory limit in KiB, checked against peak resident memory; zero means unlimited.
    /// The address space is capped at twice this.
    std::int64_t memory = 0;

    /// Wall-clock limit after which the child is killed. Defaults to 3x `time` when unset.
    std::optional<std::chrono::duration<double>> wall_time;

    Stream stdin_stream = Stream::null();
    Stream stdout_stream = Stream::capture();
    Stream stderr_stream = Stream::capture();

    /// Bytes kept from each captured stream (and from the file_io output). Exceeding it on
    /// stdout marks the process as having produced too much output.
    std::size_t output_limit = 64UL * 1024 * 1024;

    /// Name -> target symlinks created in the child's working directory
    std::map<std::string, std::string> symlinks;

    /// Name of a file, relative to the child's working directory, whose contents replace stdout
    /// as the process output once it exits
    std::optional<std::string> file_io_output;

    /// Base for the child's private working directory
    std::filesystem::path tempdir = std::filesystem::temp_directory_path();

    std::vector<std::string> env{"PATH=/usr/local/bin:/usr/bin:/bin"};
};

/// A supervised child process.
///
/// A watchdog thread kills the child once its wall-clock deadline passes, independently of
/// what the owner is blocked on. The child is only ever reaped by `wait()` (or the destructor),
/// and signals are delivered through a pidfd, so a recycled pid is never hit.
class Process : NonMovable
{
public:
    /// `args[0]` is the path of the executable
    Process(std::vector<std::string> args, LaunchOptions opts);

    /// Kills and reaps the child if it is still running
    ~Process();

    Result<void> start();

    /// Wait for the child to exit and collect what it produced.
    /// Returns {output, stderr}, where output is the file_io output if one was requested.
    std::pair<std::string, std::string> communicate();

    /// Wait for the child to exit. Repeated calls return the same result.
    RunResult wait();

    /// Kill the child right away. Reaping is still left to `wait()`.
    void kill();

    pid_t get_pid() const { return child_pid_; }

    const std::vector<std::string>& get_args() const { return args_; }

    const LaunchOptions& get_options() const { return opts_; }

    /// The following are only meaningful after `wait()`

    bool is_tle() const;
    bool is_mle() const;
    bool is_ole() const;

    /// Killed by a signal that isn't explained by a resource limit
    bool is_rte() const;

    /// Exited normally with a nonzero code
    bool is_ir() const;

    int return_code() const;
    std::optional<linux::Signal> signal() const;

    /// CPU time (user + system)
    std::chrono::duration<double> execution_time() const { return cpu_time_; }

    std::chrono::duration<double> wall_time() const { return wall_elapsed_; }

    /// Peak resident set size in KiB
    std::int64_t max_memory() const { return max_memory_; }

    /// Result bits (see ``CaseResult::Flag``) describing the run
    std::uint32_t result_flags() const;

    const std::string& stderr_output() const { return stderr_; }

    /// stdout, or the file_io output when requested
    const std::string& output() const { return output_; }

private:
    std::chrono::duration<double> effective_wall_time() const;

    Result<void> prepare_child_resources();

    /// Runs in the child between fork and exec; only async-signal-safe calls allowed
    [[noreturn]] void exec_child(const linux::CStringArray& argv, const linux::CStringArray& envp,
                                 const std::string& working_dir, int err_fd) const;

    void watchdog();

    void kill_group() noexcept;

    void collect_outputs();

    std::vector<std::string> args_;
    LaunchOptions opts_;

    pid_t child_pid_ = 0;
    UniqueFd pidfd_;

    std::optional<ScopedTempDir> working_dir_;
    UniqueFd stdout_capture_;
    UniqueFd stderr_capture_;

    std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> wall_timed_out_ = false;
    std::jthread watchdog_;

    std::optional<RunResult> run_result_;
    std::chrono::duration<double> cpu_time_{};
    std::chrono::duration<double> wall_elapsed_{};
    std::int64_t max_memory_ = 0;
    bool output_truncated_ = false;

    std::string output_;
    std::string stderr_;
};

} // namespace bridgegrader
