#pragma once

#include <bridgegrader/common/expected.hpp>

#include <utility>

#include <fcntl.h>

namespace bridgegrader {

/// Sole owner of a file descriptor; closes it on destruction.
/// Ownership moves with the object, so at any point in time exactly one UniqueFd (or one child
/// process, after `release()`) is responsible for an fd.
class UniqueFd
{
public:
    UniqueFd() = default;

    explicit UniqueFd(int fd)
        : fd_{fd} {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept
        : fd_{std::exchange(other.fd_, -1)} {}

    UniqueFd& operator=(UniqueFd&& rhs) noexcept {
        if (this != &rhs) {
            reset(std::exchange(rhs.fd_, -1));
        }

        return *this;
    }

    int get() const noexcept { return fd_; }

    bool valid() const noexcept { return fd_ != -1; }

    explicit operator bool() const noexcept { return valid(); }

    /// Gives up ownership without closing
    int release() noexcept { return std::exchange(fd_, -1); }

    /// Closes the currently owned fd (if any) and takes ownership of `fd`
    void reset(int fd = -1) noexcept;

private:
    int fd_ = -1;
};

/// Both ends of a unidirectional OS pipe
struct Pipe
{
    UniqueFd read_end;
    UniqueFd write_end;
};

/// Create a pipe. Both ends are close-on-exec: a child only ever sees the ends that are
/// explicitly dup2'd onto its standard streams.
Expected<Pipe> make_pipe(int flags = O_CLOEXEC);

} // namespace bridgegrader
