#include <bridgegrader/common/temp_file.hpp>

#include <bridgegrader/common/linux.hpp>
#include <bridgegrader/common/unique_fd.hpp>
#include <bridgegrader/logging.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <random>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>

namespace bridgegrader {

std::string random_name(std::size_t length, std::string_view alphabet) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<std::size_t> dist{0, alphabet.size() - 1};

    std::string res(length, '\0');

    for (char& chr : res) {
        chr = alphabet[dist(rng)];
    }

    return res;
}

Expected<ScopedTempFile> ScopedTempFile::create(std::string_view contents, const std::filesystem::path& dir) {
    // mkstemp requires a mutable, NUL-terminated template
    std::string pattern = (dir / "bridgegrader-XXXXXX").string();
    std::vector<char> buf{pattern.begin(), pattern.end()};
    buf.push_back('\0');

    int raw_fd = ::mkostemp(buf.data(), O_CLOEXEC);
    if (raw_fd == -1) {
        auto err = linux::make_error_code(errno);
        LOG_WARN("Could not create temporary file in {}: {}", dir, err);
        return err;
    }

    UniqueFd file{raw_fd};
    ScopedTempFile temp{std::filesystem::path{buf.data()}};

    if (auto res = linux::write_all(file.get(), contents); !res) {
        // `temp` removes the partially written file on the way out
        return res.error();
    }

    LOG_TRACE("Created temporary file {} ({} bytes)", temp.path_, contents.size());

    return temp;
}

ScopedTempFile::ScopedTempFile(ScopedTempFile&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

ScopedTempFile& ScopedTempFile::operator=(ScopedTempFile&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

ScopedTempFile::~ScopedTempFile() {
    remove();
}

void ScopedTempFile::remove() noexcept {
    if (path_.empty()) {
        return;
    }

    std::error_code err;
    if (!std::filesystem::remove(path_, err) && err) {
        LOG_WARN("Failed to remove temporary file {}: {}", path_, err);
    }

    path_.clear();
}

Expected<ScopedTempDir> ScopedTempDir::create(const std::filesystem::path& base, std::string_view prefix) {
    std::string pattern = (base / fmt::format("{}-XXXXXX", prefix)).string();
    std::vector<char> buf{pattern.begin(), pattern.end()};
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        auto err = linux::make_error_code(errno);
        LOG_WARN("Could not create temporary directory in {}: {}", base, err);
        return err;
    }

    return ScopedTempDir{std::filesystem::path{buf.data()}};
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept
    : path_{std::exchange(other.path_, {})} {}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& rhs) noexcept {
    if (this != &rhs) {
        remove();
        path_ = std::exchange(rhs.path_, {});
    }

    return *this;
}

ScopedTempDir::~ScopedTempDir() {
    remove();
}

void ScopedTempDir::remove() noexcept {
    if (path_.empty()) {
        return;
    }

    std::error_code err;
    std::filesystem::remove_all(path_, err);

    if (err) {
        LOG_WARN("Failed to remove temporary directory {}: {}", path_, err);
    }

    path_.clear();
}

} // namespace bridgegrader
