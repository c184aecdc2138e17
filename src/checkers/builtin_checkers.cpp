#include <bridgegrader/checkers/checker.hpp>

#include <bridgegrader/checkers/checker_result.hpp>
#include <bridgegrader/logging.hpp>

#include <range/v3/algorithm/equal.hpp>

#include <cctype>
#include <cstddef>
#include <string_view>
#include <vector>

namespace bridgegrader {

namespace {

bool is_space(char chr) {
    return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

std::vector<std::string_view> split_tokens(std::string_view str) {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;

    while (pos < str.size()) {
        while (pos < str.size() && is_space(str[pos])) {
            ++pos;
        }

        std::size_t start = pos;
        while (pos < str.size() && !is_space(str[pos])) {
            ++pos;
        }

        if (pos > start) {
            tokens.push_back(str.substr(start, pos - start));
        }
    }

    return tokens;
}

bool same_tokens(std::string_view lhs, std::string_view rhs) {
    return ranges::equal(split_tokens(lhs), split_tokens(rhs));
}

} // namespace

CheckerResult StandardChecker::check(std::string_view process_output, std::string_view judge_output, double points,
                                     std::string_view /*input*/) const {
    if (same_tokens(process_output, judge_output)) {
        return CheckerResult::pass(points);
    }

    return CheckerResult::fail();
}

CheckerResult IdenticalChecker::check(std::string_view process_output, std::string_view judge_output, double points,
                                      std::string_view /*input*/) const {
    if (process_output == judge_output) {
        return CheckerResult::pass(points);
    }

    if (same_tokens(process_output, judge_output)) {
        LOG_DEBUG("Output differs from the expected output only in whitespace");
        return CheckerResult::fail("Presentation Error, check your whitespace");
    }

    return CheckerResult::fail();
}

} // namespace bridgegrader
