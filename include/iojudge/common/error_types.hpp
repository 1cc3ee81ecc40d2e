#pragma once

#include <iojudge/common/expected.hpp>
#include <iojudge/common/formatters/enum.hpp>

#include <boost/preprocessor/cat.hpp>

namespace iojudge {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,       ///< Operation surpassed its (generally specified) timeout
    SyscallFailure, ///< A Linux syscall failed
    ExecFailure,    ///< The child process could not exec the requested program
    ChannelClosed,  ///< The other end of a process' I/O channel is gone
    NotStarted,     ///< Operation on a process that was never started (or was moved from)
    UnknownError,   ///< As named; use this as little as possible
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace iojudge

FMT_SERIALIZE_ENUM(::iojudge::ErrorKind, TimedOut, SyscallFailure, ExecFailure, ChannelClosed, NotStarted,
                   UnknownError);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto ident = val;                                                                                              \
        if (!ident.has_value()) {                                                                                      \
            using enum ::iojudge::ErrorKind;                                                                           \
            return e;                                                                                                  \
        }                                                                                                              \
        std::move(ident).value();                                                                                      \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
