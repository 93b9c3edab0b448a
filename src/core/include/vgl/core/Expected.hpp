/**
 * @file Expected.hpp
 * @brief Result type of every fallible runtime operation.
 *
 * Structural operations (spawn, despawn, insert, clone, observer
 * registration) return Expected<T>; callers either inspect it or forward
 * the error with VGL_TRY / VGL_TRY_VOID.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_EXPECTED_HPP
    #define VGL_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>
    #include <utility>

namespace vgl::core {

template <typename T>
using Expected = std::expected<T, Error>;

} // namespace vgl::core

/**
 * @brief Evaluates @p expr once and yields its value, or returns its error
 *        from the enclosing function.  GNU statement expression.
 */
#define VGL_TRY(expr)                                                     \
    ({                                                                     \
        auto &&vglTryResult_ = (expr);                                     \
        if (!vglTryResult_) [[unlikely]]                                   \
            return std::unexpected(std::move(vglTryResult_).error());      \
        std::move(vglTryResult_).value();                                  \
    })

/** @brief Statement form of VGL_TRY for results whose value is unused. */
#define VGL_TRY_VOID(expr)                                                \
    do {                                                                   \
        if (auto &&vglTryResult_ = (expr); !vglTryResult_) [[unlikely]]    \
            return std::unexpected(std::move(vglTryResult_).error());      \
    } while (false)

#endif // VGL_CORE_EXPECTED_HPP
