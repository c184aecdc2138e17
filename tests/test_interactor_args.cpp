#include "catch2_custom.hpp"

#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/graders/interactor_args.hpp>

#include <string>
#include <vector>

using namespace bridgegrader;
using Args = std::vector<std::string>;

TEST_CASE("Shell quoting") {
    REQUIRE(shell_quote("plain/path-1.txt") == "plain/path-1.txt");
    REQUIRE(shell_quote("") == "''");
    REQUIRE(shell_quote("has space") == "'has space'");
    REQUIRE(shell_quote("it's") == R"('it'"'"'s')");
    REQUIRE(shell_quote("$HOME") == "'$HOME'");
}

TEST_CASE("Shell splitting") {
    REQUIRE(shell_split("a  b\tc\n") == Args{"a", "b", "c"});
    REQUIRE(shell_split("") == Args{});
    REQUIRE(shell_split("'a b' c") == Args{"a b", "c"});
    REQUIRE(shell_split(R"("a \"b\" \x" c)") == Args{R"(a "b" \x)", "c"});
    REQUIRE(shell_split(R"(a\ b)") == Args{"a b"});
    REQUIRE(shell_split("''") == Args{""});
    REQUIRE(shell_split("pre'fix'\"ed\"") == Args{"prefixed"});

    REQUIRE_THROWS_AS(shell_split("'open"), ConfigError);
    REQUIRE_THROWS_AS(shell_split("\"open"), ConfigError);
    REQUIRE_THROWS_AS(shell_split("trailing\\"), ConfigError);
}

TEST_CASE("Quoting and splitting agree") {
    for (const std::string word : {"simple", "with space", "it's", "\"dq\"", "back\\slash", "$(x)", ""}) {
        REQUIRE(shell_split(shell_quote(word)) == Args{word});
    }
}

TEST_CASE("Interactor argument templates") {
    const std::string input = "/tmp/in put";
    const std::string output = "log";
    const std::string answer = "/tmp/ans";

    REQUIRE(format_interactor_args("{input_file} {answer_file}", input, output, answer) ==
            Args{"/tmp/in put", "/tmp/ans"});
    REQUIRE(format_interactor_args("{input_file} {output_file} {answer_file}", input, output, answer) ==
            Args{"/tmp/in put", "log", "/tmp/ans"});
    REQUIRE(format_interactor_args("--answer={answer_file} --strict", input, output, answer) ==
            Args{"--answer=/tmp/ans", "--strict"});
    REQUIRE(format_interactor_args("", input, output, answer) == Args{});

    // Literal braces
    REQUIRE(format_interactor_args("{{x}} {input_file}", input, output, answer) == Args{"{x}", "/tmp/in put"});
}

TEST_CASE("Bad interactor argument templates") {
    REQUIRE_THROWS_AS(format_interactor_args("{checker_file}", "a", "b", "c"), ConfigError);
    REQUIRE_THROWS_AS(format_interactor_args("{input_file", "a", "b", "c"), ConfigError);

    // Closing braces must be doubled outside of placeholders
    REQUIRE_THROWS_AS(format_interactor_args("a}b", "a", "b", "c"), ConfigError);
    REQUIRE_THROWS_AS(format_interactor_args("{input_file} }", "a", "b", "c"), ConfigError);
    REQUIRE_THROWS_AS(format_interactor_args("{input_file}}}}", "a", "b", "c"), ConfigError);
}
