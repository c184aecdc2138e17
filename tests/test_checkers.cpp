#include "catch2_custom.hpp"

#include <bridgegrader/checkers/checker.hpp>
#include <bridgegrader/checkers/checker_result.hpp>
#include <bridgegrader/exceptions.hpp>
#include <bridgegrader/registrars/auto_registrars.hpp>
#include <bridgegrader/registrars/checker_registrar.hpp>

#include <algorithm>
#include <string_view>

using namespace bridgegrader;

namespace {

/// Accepts anything, for half the points
class LenientChecker : public Checker
{
public:
    std::string_view get_name() const override { return "test-lenient"; }

    CheckerResult check(std::string_view /*process_output*/, std::string_view /*judge_output*/, double points,
                        std::string_view /*input*/) const override {
        return CheckerResult::pass(points / 2, "lenient");
    }
};

const CheckerAutoRegistrar<LenientChecker> lenient_registrar;

} // namespace

TEST_CASE("Standard checker compares tokens") {
    const StandardChecker checker;

    REQUIRE(checker.check("1 2 3\n", "1 2 3\n", 4, "") == CheckerResult::pass(4));
    REQUIRE(checker.check("  1\n2   3", "1 2 3\n", 4, "").passed);
    REQUIRE(checker.check("", "\n \n", 4, "").passed);

    REQUIRE(!checker.check("1 2", "1 2 3", 4, "").passed);
    REQUIRE(!checker.check("12 3", "1 23", 4, "").passed);
    REQUIRE(checker.check("4", "5", 4, "").points == 0);
}

TEST_CASE("Identical checker compares bytes") {
    const IdenticalChecker checker;

    REQUIRE(checker.check("a b\n", "a b\n", 1, "") == CheckerResult::pass(1));
    REQUIRE(checker.check("a  b\n", "a b\n", 1, "") == CheckerResult::fail("Presentation Error, check your whitespace"));
    REQUIRE(checker.check("a c\n", "a b\n", 1, "") == CheckerResult::fail());
}

TEST_CASE("Checker registrar lookup") {
    auto& registrar = CheckerRegistrar::get();

    REQUIRE(registrar.contains("standard"));
    REQUIRE(registrar.contains("identical"));
    REQUIRE(!registrar.contains("no-such-checker"));

    REQUIRE(registrar.get_checker("identical").get_name() == "identical");
    REQUIRE_THROWS_AS(registrar.get_checker("no-such-checker"), InternalError);

    const auto names = registrar.get_names();
    REQUIRE(std::ranges::find(names, "standard") != names.end());
}

TEST_CASE("Automatically registered checkers are usable by name") {
    const auto& checker = CheckerRegistrar::get().get_checker("test-lenient");

    REQUIRE(checker.check("wrong", "right", 10, "") == CheckerResult::pass(5, "lenient"));
}
