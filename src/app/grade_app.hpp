#pragma once

#include "app/app.hpp" // IWYU pragma: export
#include "output/reporter.hpp"

#include <bridgegrader/config/judge_env.hpp>
#include <bridgegrader/judge.hpp>

#include <string>

namespace bridgegrader {

/// Grades a single submission and reports the outcome on stdout
class GradeApp final : public App
{
public:
    using App::App;

    /// Exit code for a finished submission
    static int exit_code_for(const SubmissionReport& report);

private:
    int run_impl() override;

    JudgeEnv load_env() const;

    std::string read_source() const;
};

} // namespace bridgegrader
