#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <bridgegrader/common/temp_file.hpp>

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

using namespace bridgegrader;
namespace fs = std::filesystem;

TEST_CASE("Random names use the given alphabet") {
    auto name = random_name(16, "ab");

    REQUIRE(name.size() == 16);
    REQUIRE(name.find_first_not_of("ab") == std::string::npos);

    REQUIRE(random_name().size() == 8);
}

TEST_CASE("Scoped temporary files hold their contents and are removed") {
    auto scratch = test_helpers::make_scratch_dir();
    fs::path path;

    {
        auto file = ScopedTempFile::create("3 4\n", scratch.path());
        REQUIRE(file);

        path = file->path();
        REQUIRE(path.parent_path() == scratch.path());
        REQUIRE(test_helpers::read_file(path) == "3 4\n");
    }

    REQUIRE(!fs::exists(path));
}

TEST_CASE("Scoped temporary files are removed during unwinding") {
    auto scratch = test_helpers::make_scratch_dir();

    REQUIRE_THROWS_AS(
        [&] {
            auto file = std::move(ScopedTempFile::create("data", scratch.path()).value());
            REQUIRE(test_helpers::count_entries(scratch.path()) == 1);
            throw std::runtime_error("case aborted");
        }(),
        std::runtime_error);

    REQUIRE(test_helpers::count_entries(scratch.path()) == 0);
}

TEST_CASE("Moved-from temporary files don't remove anything") {
    auto scratch = test_helpers::make_scratch_dir();

    std::optional<ScopedTempFile> kept;

    {
        auto file = std::move(ScopedTempFile::create("x", scratch.path()).value());
        kept.emplace(std::move(file));
    }

    REQUIRE(fs::exists(kept->path()));

    const auto path = kept->path();
    kept.reset();
    REQUIRE(!fs::exists(path));
}

TEST_CASE("Scoped temporary directories are removed recursively") {
    fs::path path;

    {
        auto dir = ScopedTempDir::create(fs::temp_directory_path(), "bridgegrader-test");
        REQUIRE(dir);
        path = dir->path();

        test_helpers::write_file(path / "nested" / "file.txt", "hello");
        REQUIRE(fs::exists(path / "nested" / "file.txt"));
    }

    REQUIRE(!fs::exists(path));
}

TEST_CASE("Creating a temporary file in a missing directory fails") {
    auto scratch = test_helpers::make_scratch_dir();

    auto file = ScopedTempFile::create("x", scratch.path() / "missing");
    REQUIRE(file.has_error());
}
