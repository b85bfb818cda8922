#pragma once

#include <judgebox/common/expected.hpp>
#include <judgebox/common/extra_formatters.hpp>

#include <boost/describe/enum.hpp>
#include <boost/preprocessor/cat.hpp>

#include <utility>

namespace judgebox {

// NOLINTNEXTLINE
enum class ErrorKind {
    TimedOut,          ///< Operation surpassed its (generally caller-specified) timeout
    SyscallFailure,    ///< A Linux syscall failed
    SpawnFailure,      ///< The candidate process could not be started; considered transient
    LimitSetupFailure, ///< Resource limits or the memory watch could not be installed in the child
    ArtifactFailure,   ///< Workspace files could not be written or read back
    CheckerFailure,    ///< The checker threw or produced an out-of-range decision
    Cancelled,         ///< A stop was requested while the run was in progress
    BadArgument,       ///< Malformed submission or limits, rejected before anything runs
    UnknownError,      ///< As named; use this as little as possible
};

BOOST_DESCRIBE_ENUM(ErrorKind, TimedOut, SyscallFailure, SpawnFailure, LimitSetupFailure, ArtifactFailure,
                    CheckerFailure, Cancelled, BadArgument, UnknownError);

template <typename T>
using Result = Expected<T, ErrorKind>;

} // namespace judgebox

/// If the supplied argument is an error (unexpected) type, then propagate the error `e` up
/// the call stack. Otherwise, evaluate to the contained value
// NOLINTBEGIN(bugprone-macro-parentheses)
#define TRYE_IMPL(val, e, ident)                                                                                       \
    __extension__({                                                                                                    \
        auto&& ident = val;                                                                                            \
        if (!ident.has_value()) {                                                                                      \
            using enum ::judgebox::ErrorKind;                                                                          \
            return e;                                                                                                  \
        }                                                                                                              \
        std::forward<decltype(ident)>(ident).value();                                                                  \
    })

#define TRY_IMPL(val, ident) TRYE_IMPL(val, ident.error(), ident)
// NOLINTEND(bugprone-macro-parentheses)

#define TRYE(val, e) TRYE_IMPL(val, e, BOOST_PP_CAT(errref_uniq__, __COUNTER__))

/// If the supplied argument is an error (unexpected) type, then propagate it up the call stack.
/// Otherwise, evaluate to the contained value
#define TRY(val) TRY_IMPL(val, BOOST_PP_CAT(errrefe_uniq__, __COUNTER__))
