#pragma once

#include <bridgegrader/common/expected.hpp>
#include <bridgegrader/common/extra_formatters.hpp>
#include <bridgegrader/logging.hpp>

#include <fmt/format.h>
#include <libassert/assert.hpp>
#include <range/v3/algorithm/transform.hpp>

#include <cerrno>
#include <csignal>
#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace bridgegrader::linux {

inline std::error_code make_error_code(int err = errno) {
    return {err, std::generic_category()};
}

/// writes all of `data` to a file descriptor, retrying on short writes and EINTR. See write(2)
/// returns success/failure; logs failure at debug level
inline Expected<> write_all(int fd, std::string_view data) {
    while (!data.empty()) {
        ssize_t res = ::write(fd, data.data(), data.size());

        if (res == -1) {
            if (errno == EINTR) {
                continue;
            }

            auto err = make_error_code(errno);

            LOG_DEBUG("write failed: '{}'", err);
            return err;
        }

        data.remove_prefix(static_cast<std::size_t>(res));
    }

    return {};
}

/// reads from a file descriptor. See read(2)
/// returns success/failure; logs failure at debug level
inline Expected<std::string> read(int fd, size_t count) { // NOLINT
    std::string buffer(count, '\0');

    ssize_t res = -1;
    do {
        res = ::read(fd, buffer.data(), count);
    } while (res == -1 && errno == EINTR);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("read failed: '{}'", err);
        return err;
    }

    DEBUG_ASSERT(res >= 0, "read result is negative and != -1");
    buffer.resize(static_cast<std::size_t>(res));

    return buffer;
}

/// closes a file descriptor. See close(2)
/// returns success/failure; logs failure at debug level
inline Expected<> close(int fd) {
    int res = ::close(fd);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("close failed: '{}'", err);
        return err;
    }

    return {};
}

/// see kill(2)
/// returns success/failure; logs failure at debug level
inline Expected<> kill(pid_t pid, int sig) {
    int res = ::kill(pid, sig);

    if (res == -1) {
        auto err = make_error_code(errno);

        LOG_DEBUG("kill failed: '{}'", err);
        return err;
    }

    return {};
}

/// A NULL-terminated array of C strings, as execve(2) expects for argv and envp.
/// Has to be built before forking: allocating between fork and exec is not async-signal-safe.
class CStringArray
{
public:
    explicit CStringArray(const std::vector<std::string>& strs)
        : storage_{strs}
        , ptrs_(storage_.size() + 1, nullptr) {
        // Reason: execve requires non-const strings
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-const-cast)
        ranges::transform(storage_, ptrs_.begin(), [](std::string& str) { return str.data(); });
    }

    CStringArray(const CStringArray&) = delete;
    CStringArray& operator=(const CStringArray&) = delete;

    char* const* data() const { return ptrs_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> ptrs_;
};

/// see execve(2). argv[0] is taken to be the executable path.
/// Only returns on failure. Must not log: it is called between fork and exec.
inline std::error_code execve(const CStringArray& argv, const CStringArray& envp) {
    ::execve(argv.data()[0], argv.data(), envp.data());

    return make_error_code(errno);
}

struct Fork
{
    enum { Parent, Child } which;

    pid_t pid; // Only valid if type == Parent
};

/// see fork(2) and ``Fork``
/// returns result from enum; logs failure at debug level
inline Expected<Fork> fork() {
    pid_t res = ::fork();

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("fork failed: '{}'", err);
        return err;
    }

    if (res == 0) {
        return Fork{.which = Fork::Child, .pid = 0};
    }

    return Fork{.which = Fork::Parent, .pid = res};
}

/// see open(2)
/// returns success/failure; logs failure at debug level
inline Expected<int> open(const std::string& pathname, int flags, mode_t mode = 0) {
    // NOLINTNEXTLINE(*vararg)
    int res = ::open(pathname.c_str(), flags, mode);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("open({:?}) failed: '{}'", pathname, err);
        return err;
    }

    return res;
}

/// see lseek(2)
/// returns success/failure; logs failure at debug level
inline Expected<off_t> lseek(int fd, off_t offset, int whence) {
    off_t res = ::lseek(fd, offset, whence);

    if (res == -1) {
        auto err = make_error_code(errno);
        LOG_DEBUG("lseek failed: '{}'", err);
        return err;
    }

    return res;
}

/// see dup2(2)
/// Must not log: it is called between fork and exec.
inline Expected<> dup2(int oldfd, int newfd) {
    int res = ::dup2(oldfd, newfd);

    if (res != newfd) {
        return make_error_code(errno);
    }

    return {};
}

inline Expected<> chdir(const std::string& path) {
    if (::chdir(path.c_str()) == -1) {
        return make_error_code(errno);
    }

    return {};
}

/// Value type to behave as a linux signal
class Signal
{
public:
    // NOLINTNEXTLINE(google-explicit-constructor)
    Signal(int signal_num)
        : signal_num_{signal_num} {};

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const { return signal_num_; }

    /// Abbreviated name, e.g. "SIGSEGV"
    std::string name() const {
        const char* abbrev = sigabbrev_np(signal_num_);

        if (abbrev == nullptr) {
            return fmt::format("signal {}", signal_num_);
        }

        return fmt::format("SIG{}", abbrev);
    }

    std::string to_string() const {
        const char* descr = sigdescr_np(signal_num_);

        return descr == nullptr ? name() : descr;
    }

    friend std::string format_as(const Signal& from) { return from.name(); }

private:
    int signal_num_;
};

} // namespace bridgegrader::linux
