#pragma once

#include <bridgegrader/common/extra_formatters.hpp>

#include <fmt/base.h>
#include <fmt/format.h>

#include <string>
#include <utility>

namespace bridgegrader {

/// Verdict of a checker (or of an interactor, through its contrib module) for a single case
struct CheckerResult
{
    bool passed = false;
    double points = 0;
    std::string feedback;
    std::string extended_feedback;

    static CheckerResult pass(double points, std::string feedback = "") {
        return {.passed = true, .points = points, .feedback = std::move(feedback), .extended_feedback = ""};
    }

    static CheckerResult fail(std::string feedback = "") {
        return {.passed = false, .points = 0, .feedback = std::move(feedback), .extended_feedback = ""};
    }

    bool operator==(const CheckerResult&) const = default;
};

} // namespace bridgegrader

template <>
struct fmt::formatter<::bridgegrader::CheckerResult> : ::bridgegrader::DebugFormatter
{
    auto format(const ::bridgegrader::CheckerResult& from, format_context& ctx) const {
        if (from.feedback.empty()) {
            return format_to(ctx.out(), "{}({})", from.passed ? "pass" : "fail", from.points);
        }

        return format_to(ctx.out(), "{}({}, {:?})", from.passed ? "pass" : "fail", from.points, from.feedback);
    }
};
