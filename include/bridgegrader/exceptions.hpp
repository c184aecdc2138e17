#pragma once

#include <bridgegrader/common/error_types.hpp>
#include <bridgegrader/common/extra_formatters.hpp>

#include <fmt/base.h>
#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace bridgegrader {

/// A fault of the judge or of the problem setup (never the contestant's).
/// Grading of the current submission stops when one of these is thrown.
class InternalError : public std::runtime_error
{
public:
    explicit InternalError(const std::string& msg, ErrorKind error = ErrorKind::UnknownError)
        : std::runtime_error{msg}
        , error_{error} {}

    ErrorKind get_error() const { return error_; };

private:
    ErrorKind error_;
};

/// Malformed problem or judge configuration
class ConfigError : public InternalError
{
public:
    explicit ConfigError(const std::string& msg)
        : InternalError{msg, ErrorKind::BadConfig} {}
};

/// A compiler run failed. Carries the compiler's diagnostic output.
class CompileError : public std::runtime_error
{
public:
    explicit CompileError(const std::string& msg, std::string compiler_output = "")
        : std::runtime_error{msg}
        , output_{std::move(compiler_output)} {}

    const std::string& get_output() const { return output_; }

private:
    std::string output_;
};

} // namespace bridgegrader

template <>
struct fmt::formatter<::bridgegrader::InternalError> : ::bridgegrader::DebugFormatter
{
    auto format(const ::bridgegrader::InternalError& from, format_context& ctx) const {
        return format_to(ctx.out(), "{} : {}", from.what(), from.get_error());
    }
};
