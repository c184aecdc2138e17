#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <bridgegrader/config/judge_env.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/executors/executable.hpp>
#include <bridgegrader/executors/toolchain.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

using namespace bridgegrader;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

/// A judge environment whose languages only need /bin/sh and coreutils
JudgeEnv make_env(const fs::path& tempdir) {
    JudgeEnv env;
    env.tempdir = tempdir;

    // "Compiles" an executable script by copying it into place
    env.languages["COPY"] = {.extension = ".sh",
                             .compile = {"cp", "{sources}", "{binary}"},
                             .run = {"{binary}"},
                             .unbuffered_run = {}};
    env.languages["BROKEN"] = {.extension = ".x", .compile = {"false", "{flags}"}, .run = {"{binary}"}, .unbuffered_run = {}};
    env.languages["SLOW"] = {.extension = ".x", .compile = {"sleep", "30"}, .run = {"{binary}"}, .unbuffered_run = {}};
    env.languages["UNBUF"] = {.extension = ".sh",
                              .compile = {},
                              .run = {"/bin/sh", "{binary}"},
                              .unbuffered_run = {"/bin/sh", "-e", "{binary}"}};

    return env;
}

fs::path write_script(const fs::path& path, const std::string& body) {
    test_helpers::write_file(path, "#!/bin/sh\n" + body);
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
    return path;
}

std::string run(const Executable& exe, const std::vector<std::string>& args, const fs::path& tempdir) {
    LaunchOptions opts;
    opts.time = 5s;
    opts.tempdir = tempdir;

    auto proc = exe.launch(args, std::move(opts));
    return proc->communicate().first;
}

} // namespace

TEST_CASE("Command templates are expanded") {
    const std::vector<std::string> tmpl{"g++", "-o", "{binary}", "{flags}", "{sources}", "-lm"};

    REQUIRE(expand_command(tmpl, "out", {"a.cpp", "b.cpp"}, {"-O2"}) ==
            std::vector<std::string>{"g++", "-o", "out", "-O2", "a.cpp", "b.cpp", "-lm"});
    REQUIRE(expand_command(tmpl, "out", {"a.cpp"}, {}) ==
            std::vector<std::string>{"g++", "-o", "out", "a.cpp", "-lm"});
}

TEST_CASE("Programs are found on the PATH") {
    REQUIRE(find_program("sh").has_value());
    REQUIRE(find_program("/bin/sh") == fs::path{"/bin/sh"});
    REQUIRE(!find_program("definitely-not-a-real-program-name"));
    REQUIRE(!find_program("/definitely/not/here"));
}

TEST_CASE("Interpreted languages run their staged source") {
    auto scratch = test_helpers::make_scratch_dir();
    const auto env = make_env(scratch.path());
    const CommandToolchain toolchain{env};

    const auto source = write_script(scratch.path() / "src" / "greet.sh", "echo \"hi $1\"\n");
    auto exe = toolchain.compile({source}, {}, "SH", 10s, false);

    REQUIRE(exe.get_language() == "SH");
    REQUIRE(exe.get_command().size() == 2);
    REQUIRE(exe.get_command()[0] == "/bin/sh");
    REQUIRE(fs::path{exe.get_command()[1]}.parent_path() == exe.get_build_dir());

    REQUIRE(run(exe, {"there"}, scratch.path()) == "hi there\n");
}

TEST_CASE("Compiled languages run the build output") {
    auto scratch = test_helpers::make_scratch_dir();
    const CommandToolchain toolchain{make_env(scratch.path())};

    const auto source = write_script(scratch.path() / "src" / "prog.sh", "echo compiled\n");
    auto exe = toolchain.compile({source}, {}, "COPY", 10s, true);

    REQUIRE(exe.get_command() == std::vector<std::string>{(exe.get_build_dir() / "main").string()});
    REQUIRE(run(exe, {}, scratch.path()) == "compiled\n");
}

TEST_CASE("Unbuffered runs use the language's unbuffered command") {
    auto scratch = test_helpers::make_scratch_dir();
    const CommandToolchain toolchain{make_env(scratch.path())};
    const auto source = write_script(scratch.path() / "src" / "prog.sh", "echo x\n");

    REQUIRE(toolchain.compile({source}, {}, "UNBUF", 10s, true).get_command()[1] == "-e");
    REQUIRE(toolchain.compile({source}, {}, "UNBUF", 10s, false).get_command().size() == 2);

    // Languages without an unbuffered variant keep their regular command
    REQUIRE(toolchain.compile({source}, {}, "SH", 10s, true).get_command().size() == 2);
}

TEST_CASE("Compiler failures are compile errors") {
    auto scratch = test_helpers::make_scratch_dir();
    const CommandToolchain toolchain{make_env(scratch.path())};
    const auto source = write_script(scratch.path() / "src" / "prog.x", "");

    REQUIRE_THROWS_AS(toolchain.compile({source}, {"-Wall"}, "BROKEN", 10s, false), CompileError);
    REQUIRE_THROWS_WITH(toolchain.compile({source}, {}, "SLOW", 300ms, false),
                        Catch::Matchers::ContainsSubstring("compiler timed out"));
}

TEST_CASE("Bad build requests are configuration errors") {
    auto scratch = test_helpers::make_scratch_dir();
    const CommandToolchain toolchain{make_env(scratch.path())};
    const auto source = write_script(scratch.path() / "src" / "prog.sh", "");

    REQUIRE_THROWS_AS(toolchain.compile({source}, {}, "NOPE", 10s, false), ConfigError);
    REQUIRE_THROWS_AS(toolchain.compile({scratch.path() / "missing.sh"}, {}, "SH", 10s, false), ConfigError);
    REQUIRE_THROWS_AS(toolchain.compile({}, {}, "SH", 10s, false), ConfigError);
}

TEST_CASE("Building twice gives independent executables") {
    auto scratch = test_helpers::make_scratch_dir();
    const CommandToolchain toolchain{make_env(scratch.path())};
    const auto source = write_script(scratch.path() / "src" / "prog.sh", "echo same\n");

    {
        auto first = toolchain.compile({source}, {}, "COPY", 10s, false);
        auto second = toolchain.compile({source}, {}, "COPY", 10s, false);

        REQUIRE(first.get_build_dir() != second.get_build_dir());
        REQUIRE(run(first, {}, scratch.path()) == run(second, {}, scratch.path()));

        // Copies share the build directory
        auto copy = first;
        REQUIRE(copy.get_build_dir() == first.get_build_dir());
    }

    // Only the source directory is left behind
    REQUIRE(test_helpers::count_entries(scratch.path()) == 1);
}
