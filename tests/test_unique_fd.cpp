#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <bridgegrader/common/linux.hpp>
#include <bridgegrader/common/unique_fd.hpp>

#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

using namespace bridgegrader;

TEST_CASE("UniqueFd closes on destruction") {
    const auto before = test_helpers::count_open_fds();

    {
        auto pipe = make_pipe();
        REQUIRE(pipe);
        REQUIRE(pipe->read_end.valid());
        REQUIRE(pipe->write_end.valid());
        REQUIRE(test_helpers::count_open_fds() == before + 2);
    }

    REQUIRE(test_helpers::count_open_fds() == before);
}

TEST_CASE("UniqueFd ownership moves with the object") {
    auto pipe = std::move(make_pipe().value());
    const int raw = pipe.read_end.get();

    UniqueFd moved{std::move(pipe.read_end)};
    REQUIRE(!pipe.read_end.valid());
    REQUIRE(moved.get() == raw);

    UniqueFd assigned;
    assigned = std::move(moved);
    REQUIRE(!moved);
    REQUIRE(assigned.get() == raw);

    const int released = assigned.release();
    REQUIRE(released == raw);
    REQUIRE(!assigned.valid());

    // Nothing closed it, so it's still ours to close
    REQUIRE(::fcntl(released, F_GETFD) != -1);
    ::close(released);
}

TEST_CASE("Pipes are close-on-exec") {
    auto pipe = std::move(make_pipe().value());

    REQUIRE((::fcntl(pipe.read_end.get(), F_GETFD) & FD_CLOEXEC) != 0);
    REQUIRE((::fcntl(pipe.write_end.get(), F_GETFD) & FD_CLOEXEC) != 0);
}

TEST_CASE("Data written to a pipe can be read back") {
    auto pipe = std::move(make_pipe().value());

    REQUIRE(linux::write_all(pipe.write_end.get(), "ping"));
    pipe.write_end.reset();

    auto data = linux::read(pipe.read_end.get(), 16);
    REQUIRE(data);
    REQUIRE(*data == "ping");

    // EOF once the write end is gone
    REQUIRE(linux::read(pipe.read_end.get(), 16).value().empty());
}
