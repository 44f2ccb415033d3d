#pragma once

#include <sandtest/common/expected.hpp>
#include <sandtest/common/formatters.hpp>

#include <boost/preprocessor/cat.hpp>

namespace sandtest {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,          ///< Operation surpassed its (generally specified) timeout
    UnresolvedSymbol,  ///< Failed to resolve a named symbol in a loaded unit
    ProtocolViolation, ///< A peer process sent data that does not follow the expected framing
    BadArgument,       ///< Malformed input supplied by a caller
    UnknownError,      ///< As named; use this as little as possible
    SyscallFailure,    ///< A Linux syscall failed

    MaxErrorNum // Not a proper error; used to determine the number of errors
};

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace sandtest

FMT_SERIALIZE_ENUM(::sandtest::ErrorKind, TimedOut, UnresolvedSymbol, ProtocolViolation, BadArgument, UnknownError,
                   SyscallFailure, MaxErrorNum);

/// If the supplied argument is an error (unexpected) type, then propegate the error type `e` up
/// the call stack. Otherwise, continue execution as normal
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        const auto& ident = val;                                                                                       \
        if (!ident.has_value()) {                                                                                      \
            using enum ::sandtest::ErrorKind;                                                                          \
            return e;                                                                                                  \
        }                                                                                                              \
        ident.value();                                                                                                 \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propegate it up the call stack.
/// Otherwise, continue execution as normal
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
