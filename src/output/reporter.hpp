#pragma once

#include "output/sink.hpp"
#include "output/verbosity.hpp"

#include <bridgegrader/common/class_traits.hpp>
#include <bridgegrader/judge.hpp>
#include <bridgegrader/result.hpp>

#include <cstddef>
#include <string_view>

namespace bridgegrader {

/// Turns grading outcomes into user-facing output
class Reporter : NonCopyable
{
public:
    explicit Reporter(Sink& sink, VerbosityLevel verbosity)
        : sink_{sink}
        , verbosity_{verbosity} {}

    virtual ~Reporter() = default;

    virtual void on_submission_begin(std::string_view problem_id, std::string_view language) = 0;
    virtual void on_case_result(std::size_t position, const CaseResult& result) = 0;
    virtual void on_compile_error(std::string_view output) = 0;
    virtual void on_internal_error(std::string_view what) = 0;
    virtual void on_summary(const SubmissionReport& report) = 0;

    virtual void on_warning(std::string_view what) = 0;
    virtual void on_error(std::string_view what) = 0;

    virtual void finalize() = 0;

    /// Drive the callbacks above for a finished submission
    void report(const SubmissionReport& report);

protected:
    Sink& sink_;
    VerbosityLevel verbosity_;
};

} // namespace bridgegrader
