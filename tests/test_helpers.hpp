#pragma once

#include <bridgegrader/common/temp_file.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>

namespace test_helpers {

/// Number of file descriptors currently open in this process
inline std::size_t count_open_fds() {
    auto entries = std::filesystem::directory_iterator{"/proc/self/fd"};

    // The iterator holds one fd of its own while counting
    return static_cast<std::size_t>(std::distance(begin(entries), end(entries))) - 1;
}

inline std::size_t count_entries(const std::filesystem::path& dir) {
    auto entries = std::filesystem::directory_iterator{dir};
    return static_cast<std::size_t>(std::distance(begin(entries), end(entries)));
}

inline void write_file(const std::filesystem::path& path, std::string_view contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream file{path, std::ios::binary};
    file << contents;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream file{path, std::ios::binary};
    return {std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
}

/// A scratch directory for a single test
inline bridgegrader::ScopedTempDir make_scratch_dir() {
    return std::move(bridgegrader::ScopedTempDir::create(std::filesystem::temp_directory_path(), "bridgegrader-test")
                         .value());
}

} // namespace test_helpers
