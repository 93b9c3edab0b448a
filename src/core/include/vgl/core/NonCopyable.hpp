/**
 * @file NonCopyable.hpp
 * @brief Ownership bases for runtime objects.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_NON_COPYABLE_HPP
    #define VGL_CORE_NON_COPYABLE_HPP

namespace vgl::core {

/** @brief Move-only: storage owners such as the registry and the observer index. */
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &) = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)      = default;
};

/**
 * @brief Neither copyable nor movable.
 *
 * For objects other code refers to by address for their whole lifetime:
 * DeferredWorld views and cloner builders hold a World&.
 */
class Pinned {
protected:
    Pinned()  = default;
    ~Pinned() = default;

    Pinned(const Pinned &)            = delete;
    Pinned &operator=(const Pinned &) = delete;
};

} // namespace vgl::core

#endif // VGL_CORE_NON_COPYABLE_HPP
