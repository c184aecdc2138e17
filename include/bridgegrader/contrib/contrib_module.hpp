/// \file
/// Return-code conventions of helper programs (interactors, checkers)
#pragma once

#include <bridgegrader/checkers/checker_result.hpp>
#include <bridgegrader/executors/executable.hpp>
#include <bridgegrader/subprocess/process.hpp>

#include <boost/describe/enum.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string_view>

namespace bridgegrader {

// NOLINTNEXTLINE
enum class ContribType { Default, Testlib };

BOOST_DESCRIBE_ENUM(ContribType, Default, Testlib);

/// Everything a contrib module needs to judge a finished helper process
struct HelperRun
{
    const Process& process;
    const Executable& binary;
    double points;
    std::chrono::duration<double> time_limit;
    /// KiB
    std::int64_t memory_limit;
    std::string_view feedback;
    std::string_view extended_feedback;
    /// Used in error messages, e.g. "interactor"
    std::string_view name;
    std::string_view stderr_output;
};

class ContribModule
{
public:
    virtual ~ContribModule() = default;

    virtual ContribType get_type() const = 0;

    /// Argument template for interactors of this convention.
    /// Knows the placeholders {input_file}, {output_file} and {answer_file}.
    virtual std::string_view interactor_args_format() const = 0;

    /// Turn the helper's exit status into a verdict.
    /// Throws InternalError when the helper itself failed.
    virtual CheckerResult parse_return_code(const HelperRun& run) const = 0;

protected:
    /// Throws an InternalError describing how the helper failed
    [[noreturn]] static void raise_helper_error(const HelperRun& run);
};

/// Exit code 0 accepts, 1 rejects
class DefaultContrib : public ContribModule
{
public:
    static constexpr int AC = 0;
    static constexpr int WA = 1;

    ContribType get_type() const override { return ContribType::Default; }

    std::string_view interactor_args_format() const override { return "{input_file} {answer_file}"; }

    CheckerResult parse_return_code(const HelperRun& run) const override;
};

/// Exit codes of testlib.h. Partial scores are read from stderr as "points <fraction>".
class TestlibContrib : public ContribModule
{
public:
    static constexpr int AC = 0;
    static constexpr int WA = 1;
    static constexpr int PE = 2;
    static constexpr int IE = 3;
    static constexpr int PARTIAL = 7;

    ContribType get_type() const override { return ContribType::Testlib; }

    std::string_view interactor_args_format() const override { return "{input_file} {output_file} {answer_file}"; }

    CheckerResult parse_return_code(const HelperRun& run) const override;

    /// The fraction in a "points <fraction>" line, if any
    static std::optional<double> parse_partial_points(std::string_view stderr_output);
};

const ContribModule& get_contrib_module(ContribType type);

/// Map a configuration tag ("default", "testlib") to its type
std::optional<ContribType> parse_contrib_type(std::string_view tag);

} // namespace bridgegrader
