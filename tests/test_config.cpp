#include "catch2_custom.hpp"

#include "test_helpers.hpp"

#include <bridgegrader/config/handler_data.hpp>
#include <bridgegrader/config/judge_env.hpp>
#include <bridgegrader/config/json_fields.hpp>
#include <bridgegrader/config/problem.hpp>
#include <bridgegrader/exceptions.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

using namespace bridgegrader;
using namespace std::chrono_literals;
using nlohmann::json;

TEST_CASE("Judge environment defaults") {
    const auto env = json::object().get<JudgeEnv>();

    REQUIRE(env.generator_memory_limit == 524288);
    REQUIRE(env.compiler_time_limit == 10s);
    REQUIRE(env.problem_storage.empty());

    for (const auto* key : {"CPP17", "C", "PY3", "SH"}) {
        REQUIRE(env.languages.contains(key));
    }

    REQUIRE(env.get_language("SH").is_interpreted());
    REQUIRE(!env.get_language("CPP17").is_interpreted());
    REQUIRE_THROWS_AS(env.get_language("COBOL"), ConfigError);
}

TEST_CASE("Judge environment from JSON") {
    const auto env = json::parse(R"({
        "problem_storage": {"default": ["/srv/problems", "/srv/more"]},
        "generator_memory_limit": 1024,
        "compiler_time_limit": 2.5,
        "tempdir": "/var/tmp",
        "languages": {
            "AWK": {"extension": ".awk", "run": ["awk", "-f", "{binary}"]},
            "SH": {"extension": ".sh", "run": ["/bin/bash", "{binary}"]}
        }
    })")
                         .get<JudgeEnv>();

    REQUIRE(env.problem_storage.at("default").size() == 2);
    REQUIRE(env.problem_storage.at("default")[1] == std::filesystem::path{"/srv/more"});
    REQUIRE(env.generator_memory_limit == 1024);
    REQUIRE(env.compiler_time_limit == 2500ms);
    REQUIRE(env.tempdir == std::filesystem::path{"/var/tmp"});

    // Configured languages extend and override the built-in ones
    REQUIRE(env.get_language("AWK").run.front() == "awk");
    REQUIRE(env.get_language("SH").run.front() == "/bin/bash");
    REQUIRE(env.languages.contains("CPP17"));
}

TEST_CASE("Malformed judge environments are rejected") {
    REQUIRE_THROWS_AS(json::parse(R"({"generator_memory_limit": "lots"})").get<JudgeEnv>(), ConfigError);
    REQUIRE_THROWS_AS(json::parse(R"({"generator_memory_limit": -1})").get<JudgeEnv>(), ConfigError);
    REQUIRE_THROWS_AS(json::parse(R"({"languages": {"X": {"run": []}}})").get<JudgeEnv>(), ConfigError);
    REQUIRE_THROWS_AS(json::parse(R"({"languages": []})").get<JudgeEnv>(), ConfigError);
}

TEST_CASE("Loading a judge environment file") {
    auto scratch = test_helpers::make_scratch_dir();

    REQUIRE_THROWS_AS(JudgeEnv::load(scratch.path() / "missing.json"), ConfigError);

    test_helpers::write_file(scratch.path() / "broken.json", "{ not json");
    REQUIRE_THROWS_AS(JudgeEnv::load(scratch.path() / "broken.json"), ConfigError);

    test_helpers::write_file(scratch.path() / "env.json", R"({"compiler_time_limit": 3})");
    REQUIRE(JudgeEnv::load(scratch.path() / "env.json").compiler_time_limit == 3s);
}

TEST_CASE("Interactive section defaults") {
    JudgeEnv env;
    env.compiler_time_limit = 7s;

    const auto data = HandlerData::parse(json::parse(R"({"files": "interactor.sh", "lang": "SH"})"), env);

    REQUIRE(data.files == std::vector<std::string>{"interactor.sh"});
    REQUIRE(data.flags.empty());
    REQUIRE(data.lang == "SH");
    REQUIRE(data.compiler_time_limit == 7s);
    REQUIRE(data.unbuffered);
    REQUIRE(!data.args_format_string);
    REQUIRE(data.preprocessing_time == 2s);
    REQUIRE(!data.time_limit);
    REQUIRE(!data.memory_limit);
    REQUIRE(data.type == "default");
}

TEST_CASE("Interactive section with every field") {
    const auto data = HandlerData::parse(json::parse(R"({
        "files": ["interactor.cpp", "testlib.h"],
        "flags": ["-DONLINE_JUDGE"],
        "lang": "CPP17",
        "compiler_time_limit": 30,
        "unbuffered": false,
        "args_format_string": "{answer_file} {input_file}",
        "preprocessing_time": 0.5,
        "time_limit": 4,
        "memory_limit": 65536,
        "type": "testlib"
    })"),
                                         JudgeEnv{});

    REQUIRE(data.files.size() == 2);
    REQUIRE(data.flags == std::vector<std::string>{"-DONLINE_JUDGE"});
    REQUIRE(data.compiler_time_limit == 30s);
    REQUIRE(!data.unbuffered);
    REQUIRE(data.args_format_string == "{answer_file} {input_file}");
    REQUIRE(data.preprocessing_time == 500ms);
    REQUIRE(data.time_limit == std::chrono::duration<double>{4});
    REQUIRE(data.memory_limit == 65536);
    REQUIRE(data.type == "testlib");
}

TEST_CASE("Malformed interactive sections are rejected") {
    const JudgeEnv env;

    const auto parse = [&](const char* text) { return HandlerData::parse(json::parse(text), env); };

    REQUIRE_THROWS_AS(parse(R"({"lang": "SH"})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"files": [], "lang": "SH"})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"files": 5, "lang": "SH"})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"files": ["a.sh", 3], "lang": "SH"})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"files": "a.sh"})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"files": "a.sh", "lang": "BRAINFUCK"})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"files": "a.sh", "lang": "SH", "preprocessing_time": -1})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"files": "a.sh", "lang": "SH", "memory_limit": 0})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"("files")"), ConfigError);
}

TEST_CASE("Problem configuration") {
    const auto root = std::filesystem::path{"/problems/aplusb"};

    const auto problem = parse_problem(json::parse(R"({
        "time_limit": 2,
        "memory_limit": 65536,
        "checker": "identical",
        "interactive": {"files": "interactor.sh", "lang": "SH"},
        "test_cases": [
            {"in": "1.in", "out": "1.out"},
            {"in": "2.in", "out": "2.out", "points": 5, "checker": "standard", "wall_time_factor": 1.5,
             "symlinks": {"lib.txt": "/usr/share/dict/words"}}
        ]
    })"),
                                       root, JudgeEnv{});

    REQUIRE(problem.time_limit == 2s);
    REQUIRE(problem.memory_limit == 65536);
    REQUIRE(problem.interactive.has_value());
    REQUIRE(problem.cases.size() == 2);
    REQUIRE(problem.total_points() == 6);

    const auto& first = problem.cases[0];
    REQUIRE(first.position == 1);
    REQUIRE(first.input_file == root / "1.in");
    REQUIRE(first.points == 1);
    REQUIRE(first.checker == "identical");
    REQUIRE(first.wall_time_factor == 3);

    const auto& second = problem.cases[1];
    REQUIRE(second.position == 2);
    REQUIRE(second.checker == "standard");
    REQUIRE(second.wall_time_factor == 1.5);
    REQUIRE(second.symlinks.at("lib.txt") == "/usr/share/dict/words");
}

TEST_CASE("Malformed problem configurations are rejected") {
    const auto parse = [](const char* text) { return parse_problem(json::parse(text), "/p", JudgeEnv{}); };

    REQUIRE_THROWS_AS(parse(R"({"memory_limit": 1, "test_cases": []})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"time_limit": 0, "memory_limit": 1, "test_cases": []})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"time_limit": 1, "memory_limit": 1})"), ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"time_limit": 1, "memory_limit": 1, "test_cases": [{"in": "1.in"}]})"), ConfigError);
    REQUIRE_THROWS_AS(
        parse(R"({"time_limit": 1, "memory_limit": 1, "test_cases": [{"in": "a", "out": "b", "points": -1}]})"),
        ConfigError);
    REQUIRE_THROWS_AS(parse(R"({"time_limit": 1, "memory_limit": 1, "test_cases": [], "interactive": {}})"),
                      ConfigError);
}

TEST_CASE("Problem storage lookup") {
    auto scratch = test_helpers::make_scratch_dir();
    const auto first_root = scratch.path() / "first";
    const auto second_root = scratch.path() / "second";

    test_helpers::write_file(second_root / "aplusb" / PROBLEM_CONFIG_NAME, "{}");
    test_helpers::write_file(first_root / "noconfig" / "1.in", "");
    std::filesystem::create_directories(first_root);

    ProblemStorage storage{{{"default", {first_root, second_root}}}};

    REQUIRE(storage.get_problem_root("aplusb", "default") == second_root / "aplusb");
    REQUIRE(!storage.get_problem_root("aplusb", "other"));
    REQUIRE(!storage.get_problem_root("noconfig", "default"));
    REQUIRE(!storage.get_problem_root("missing", "default"));

    // Ids can only name a direct child of a root
    REQUIRE(!storage.get_problem_root("..", "default"));
    REQUIRE(!storage.get_problem_root(".", "default"));
    REQUIRE(!storage.get_problem_root("second/aplusb", "default"));
    REQUIRE(!storage.get_problem_root("", "default"));

    storage.add_root("other", second_root);
    REQUIRE(storage.get_problem_root("aplusb", "other"));
}

TEST_CASE("Loading problems from storage") {
    auto scratch = test_helpers::make_scratch_dir();
    const auto problem_dir = scratch.path() / "echo";

    test_helpers::write_file(problem_dir / PROBLEM_CONFIG_NAME,
                             R"({"time_limit": 1, "memory_limit": 65536, "test_cases": [{"in": "1.in", "out": "1.out"}]})");
    test_helpers::write_file(problem_dir / "1.in", "hello\n");
    test_helpers::write_file(problem_dir / "1.out", "hello\n");

    ProblemStorage storage;
    storage.add_root("default", scratch.path());

    const auto problem = load_problem(storage, "echo", "default", JudgeEnv{});

    REQUIRE(problem.id == "echo");
    REQUIRE(problem.storage_namespace == "default");
    REQUIRE(!problem.interactive);
    REQUIRE(problem.cases.at(0).input_data() == "hello\n");
    REQUIRE(problem.cases.at(0).output_data() == "hello\n");

    REQUIRE_THROWS_AS(load_problem(storage, "missing", "default", JudgeEnv{}), ConfigError);

    TestCase unreadable{.position = 1, .input_file = problem_dir / "nope.in"};
    REQUIRE_THROWS_AS(unreadable.input_data(), ConfigError);
}
