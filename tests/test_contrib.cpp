#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <bridgegrader/checkers/checker_result.hpp>
#include <bridgegrader/common/temp_file.hpp>
#include <bridgegrader/contrib/contrib_module.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/executors/executable.hpp>
#include <bridgegrader/subprocess/process.hpp>

#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <utility>

using namespace bridgegrader;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;

namespace {

/// Runs `script` as a helper and lets the `type` contrib module judge it
CheckerResult judge_helper(ContribType type, const std::string& script, double points = 10,
                           std::chrono::duration<double> time_limit = 5s) {
    auto scratch = test_helpers::make_scratch_dir();
    auto build_dir = std::make_shared<const ScopedTempDir>(test_helpers::make_scratch_dir());

    const Executable binary{{"/bin/sh", "-c", script, "helper"}, "SH", build_dir};

    LaunchOptions opts;
    opts.time = time_limit;
    opts.wall_time = time_limit;
    opts.tempdir = scratch.path();

    auto proc = binary.launch({}, opts);
    std::ignore = proc->communicate();
    std::ignore = proc->wait();

    const HelperRun run{
        .process = *proc,
        .binary = binary,
        .points = points,
        .time_limit = time_limit,
        .memory_limit = 1024,
        .feedback = "feedback",
        .extended_feedback = proc->stderr_output(),
        .name = "interactor",
        .stderr_output = proc->stderr_output(),
    };

    return get_contrib_module(type).parse_return_code(run);
}

} // namespace

TEST_CASE("Contrib type tags") {
    REQUIRE(parse_contrib_type("default") == ContribType::Default);
    REQUIRE(parse_contrib_type("testlib") == ContribType::Testlib);
    REQUIRE(parse_contrib_type("Testlib") == std::nullopt);
    REQUIRE(parse_contrib_type("") == std::nullopt);

    REQUIRE(get_contrib_module(ContribType::Default).get_type() == ContribType::Default);
    REQUIRE(get_contrib_module(ContribType::Testlib).get_type() == ContribType::Testlib);
}

TEST_CASE("Interactor argument templates per contrib type") {
    REQUIRE(get_contrib_module(ContribType::Default).interactor_args_format() == "{input_file} {answer_file}");
    REQUIRE(get_contrib_module(ContribType::Testlib).interactor_args_format() ==
            "{input_file} {output_file} {answer_file}");
}

TEST_CASE("Default contrib return codes") {
    auto res = judge_helper(ContribType::Default, "exit 0");
    REQUIRE(res.passed);
    REQUIRE(res.points == 10);
    REQUIRE(res.feedback == "feedback");

    res = judge_helper(ContribType::Default, "echo 'wrong answer' >&2; exit 1");
    REQUIRE(!res.passed);
    REQUIRE(res.points == 0);
    REQUIRE(res.extended_feedback == "wrong answer\n");

    REQUIRE_THROWS_WITH(judge_helper(ContribType::Default, "exit 2"),
                        "interactor exited with unexpected return code 2");

    // testlib's partial code means nothing here
    REQUIRE_THROWS_AS(judge_helper(ContribType::Default, "exit 7"), InternalError);
}

TEST_CASE("Helper failures are internal errors") {
    REQUIRE_THROWS_WITH(judge_helper(ContribType::Default, "echo boom >&2; exit 4"),
                        R"(interactor exited with unexpected return code 4 with stderr "boom\n")");

    REQUIRE_THROWS_WITH(judge_helper(ContribType::Testlib, "kill -SEGV $$"), "interactor raised signal SIGSEGV");

    REQUIRE_THROWS_WITH(judge_helper(ContribType::Default, "sleep 5", 10, 300ms),
                        "interactor timed out (> 0.3 seconds)");

    try {
        std::ignore = judge_helper(ContribType::Default, "exit 9");
        FAIL("expected an InternalError");
    } catch (const InternalError& err) {
        REQUIRE(err.get_error() == ErrorKind::ProcessFailure);
    }
}

TEST_CASE("Testlib contrib return codes") {
    auto res = judge_helper(ContribType::Testlib, "exit 0");
    REQUIRE(res.passed);
    REQUIRE(res.points == 10);

    res = judge_helper(ContribType::Testlib, "exit 1");
    REQUIRE(!res.passed);

    // Presentation errors are plain wrong answers
    res = judge_helper(ContribType::Testlib, "exit 2");
    REQUIRE(!res.passed);
    REQUIRE(res.points == 0);

    REQUIRE_THROWS_WITH(judge_helper(ContribType::Testlib, "echo 'bad input' >&2; exit 3"),
                        ContainsSubstring("interactor failed assertion with message feedback bad input"));

    REQUIRE_THROWS_WITH(judge_helper(ContribType::Testlib, "exit 5"),
                        "interactor exited with unexpected return code 5");
}

TEST_CASE("Testlib partial points") {
    auto res = judge_helper(ContribType::Testlib, "echo 'points 0.25' >&2; exit 7", 8);
    REQUIRE(res.passed);
    REQUIRE(res.points == 2);

    res = judge_helper(ContribType::Testlib, "echo 'some log' >&2; echo 'points 1' >&2; exit 7", 8);
    REQUIRE(res.points == 8);

    REQUIRE_THROWS_WITH(judge_helper(ContribType::Testlib, "echo 'half' >&2; exit 7"),
                        ContainsSubstring("invalid stderr for partial points"));

    REQUIRE_THROWS_WITH(judge_helper(ContribType::Testlib, "echo 'points 1.5' >&2; exit 7"),
                        "invalid partial points: 1.5");
    REQUIRE_THROWS_WITH(judge_helper(ContribType::Testlib, "echo 'points -0.5' >&2; exit 7"),
                        "invalid partial points: -0.5");

    // Far too large to be a double
    REQUIRE_THROWS_WITH(judge_helper(ContribType::Testlib, "printf 'points 1%0400d\\n' 0 >&2; exit 7"),
                        ContainsSubstring("invalid partial points"));
}

TEST_CASE("Parsing partial points from stderr") {
    REQUIRE(TestlibContrib::parse_partial_points("points 0.5") == 0.5);
    REQUIRE(TestlibContrib::parse_partial_points("points .75\n") == 0.75);
    REQUIRE(TestlibContrib::parse_partial_points("checking...\npoints 1\n") == 1.0);
    REQUIRE(TestlibContrib::parse_partial_points("points +0.125 extra") == 0.125);

    REQUIRE(TestlibContrib::parse_partial_points("") == std::nullopt);
    REQUIRE(TestlibContrib::parse_partial_points("point 0.5") == std::nullopt);
    REQUIRE(TestlibContrib::parse_partial_points("total points 0.5") == std::nullopt);

    // Values beyond the range of a double saturate rather than throw
    const auto huge = TestlibContrib::parse_partial_points("points 1" + std::string(400, '0'));
    REQUIRE(huge);
    REQUIRE(std::isinf(*huge));
    REQUIRE(TestlibContrib::parse_partial_points("points 0." + std::string(400, '0') + "1") == 0.0);
}
