/**
 * @file Concepts.hpp
 * @brief C++20 concepts constraining generic containers of the runtime.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_CONCEPTS_HPP
    #define VGL_CORE_CONCEPTS_HPP

    #include "Types.hpp"

    #include <concepts>

namespace vgl::core {

/**
 * @brief A handle that decomposes into a dense slot index and compares by
 *        full identity (slot and generation).
 */
template <typename K>
concept SlotKey = std::equality_comparable<K> && requires(const K &key) {
    { key.slot() } -> std::convertible_to<u32>;
};

} // namespace vgl::core

#endif // VGL_CORE_CONCEPTS_HPP
