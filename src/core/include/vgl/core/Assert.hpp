/**
 * @file Assert.hpp
 * @brief Contract-checking macros with source location.
 *
 * Provides VGL_ASSERT (debug-only, container preconditions) and
 * VGL_VERIFY (always evaluated, observer bookkeeping).  A failing check is reported through Log::fatal with
 * the expression, a message and the file, line and function, then the
 * process aborts.  Failures are never recoverable: they mean an internal
 * index of the runtime is already corrupt.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_ASSERT_HPP
    #define VGL_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <source_location>

namespace vgl::core::detail {

/**
 * @brief Logs a failed contract and aborts.
 * @param expr Stringified failing expression.
 * @param msg  Context supplied by the call site.
 * @param loc  Location of the check.
 */
[[noreturn]] void assertFail(
    const char *expr,
    const char *msg,
    std::source_location loc = std::source_location::current()
);

} // namespace vgl::core::detail

    #ifdef VGL_DEBUG
        #define VGL_ASSERT(cond, msg)                                     \
            do {                                                           \
                if (VGL_UNLIKELY(!(cond)))                                 \
                    ::vgl::core::detail::assertFail(#cond, msg);           \
            } while (false)
    #else
        #define VGL_ASSERT(cond, msg) ((void)0)
    #endif

    #define VGL_VERIFY(cond, msg)                                         \
        do {                                                               \
            if (VGL_UNLIKELY(!(cond)))                                     \
                ::vgl::core::detail::assertFail(#cond, msg);               \
        } while (false)

#endif // VGL_CORE_ASSERT_HPP
