#include <bridgegrader/common/unique_fd.hpp>

#include <bridgegrader/common/linux.hpp>
#include <bridgegrader/logging.hpp>

#include <array>
#include <cerrno>
#include <utility>

#include <unistd.h>

namespace bridgegrader {

void UniqueFd::reset(int fd) noexcept {
    if (fd_ != -1 && fd_ != fd) {
        if (auto res = linux::close(fd_); !res) {
            LOG_WARN("Failed to close fd {}: {}", fd_, res.error());
        }
    }

    fd_ = fd;
}

Expected<Pipe> make_pipe(int flags) {
    std::array<int, 2> fds{-1, -1};

    if (::pipe2(fds.data(), flags) == -1) {
        auto err = linux::make_error_code(errno);

        LOG_DEBUG("pipe2 failed: '{}'", err);

        return err;
    }

    return Pipe{.read_end = UniqueFd{fds[0]}, .write_end = UniqueFd{fds[1]}};
}

} // namespace bridgegrader
