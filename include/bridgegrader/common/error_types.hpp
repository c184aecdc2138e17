#pragma once

#include <bridgegrader/common/expected.hpp>

#include <boost/describe/enum.hpp>
#include <boost/preprocessor/cat.hpp>

namespace bridgegrader {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Process / operation surpassed its allotted time
    SyscallFailure, ///< A Linux syscall failed
    BadConfig,      ///< Malformed or inconsistent configuration
    CompileFailure, ///< A compiler run exited unsuccessfully
    ProcessFailure, ///< A child process could not be started or supervised
    UnknownError,   ///< As named; use this as little as possible
};

BOOST_DESCRIBE_ENUM(ErrorKind, TimedOut, SyscallFailure, BadConfig, CompileFailure, ProcessFailure, UnknownError);

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace bridgegrader

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::bridgegrader::ErrorKind;                                                                      \
            return e;                                                                                                  \
        }                                                                                                              \
        ::bridgegrader::detail::take_value(std::move(ident));                                                          \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
