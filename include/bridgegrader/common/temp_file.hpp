#pragma once

#include <bridgegrader/common/class_traits.hpp>
#include <bridgegrader/common/expected.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace bridgegrader {

/// Characters used for randomly generated file names
inline constexpr std::string_view RANDOM_NAME_ALPHABET = "abcdefghijklmnopqrstuvwxyz0123456789_";

/// Generate a random name of `length` characters drawn from `alphabet`
std::string random_name(std::size_t length = 8, std::string_view alphabet = RANDOM_NAME_ALPHABET);

/// A file with fixed contents that exists for exactly as long as this object does.
/// Removal happens in the destructor, so it also runs during stack unwinding.
class ScopedTempFile : NonCopyable
{
public:
    /// Create a new file under `dir` holding `contents`
    static Expected<ScopedTempFile> create(std::string_view contents,
                                           const std::filesystem::path& dir = std::filesystem::temp_directory_path());

    ScopedTempFile(ScopedTempFile&& other) noexcept;
    ScopedTempFile& operator=(ScopedTempFile&& rhs) noexcept;

    ~ScopedTempFile();

    const std::filesystem::path& path() const noexcept { return path_; }

    /// Convenience for the common case of passing the path to a child process
    std::string name() const { return path_.string(); }

private:
    explicit ScopedTempFile(std::filesystem::path path)
        : path_{std::move(path)} {}

    void remove() noexcept;

    std::filesystem::path path_;
};

/// A directory that is (recursively) removed when this object is destroyed.
class ScopedTempDir : NonCopyable
{
public:
    static Expected<ScopedTempDir> create(const std::filesystem::path& base = std::filesystem::temp_directory_path(),
                                          std::string_view prefix = "bridgegrader");

    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& rhs) noexcept;

    ~ScopedTempDir();

    const std::filesystem::path& path() const noexcept { return path_; }

private:
    explicit ScopedTempDir(std::filesystem::path path)
        : path_{std::move(path)} {}

    void remove() noexcept;

    std::filesystem::path path_;
};

} // namespace bridgegrader
