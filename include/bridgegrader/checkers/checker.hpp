#pragma once

#include <bridgegrader/checkers/checker_result.hpp>

#include <string_view>

namespace bridgegrader {

/// Judges a process's output against the expected output
class Checker
{
public:
    virtual ~Checker() = default;

    virtual std::string_view get_name() const = 0;

    virtual CheckerResult check(std::string_view process_output, std::string_view judge_output, double points,
                                std::string_view input) const = 0;
};

/// Output and expected output consist of the same whitespace-separated tokens
class StandardChecker : public Checker
{
public:
    std::string_view get_name() const override { return "standard"; }

    CheckerResult check(std::string_view process_output, std::string_view judge_output, double points,
                        std::string_view input) const override;
};

/// Output and expected output are byte-for-byte identical
class IdenticalChecker : public Checker
{
public:
    std::string_view get_name() const override { return "identical"; }

    CheckerResult check(std::string_view process_output, std::string_view judge_output, double points,
                        std::string_view input) const override;
};

} // namespace bridgegrader
