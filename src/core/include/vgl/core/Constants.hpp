/**
 * @file Constants.hpp
 * @brief Compile-time limits of the entity runtime.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_CONSTANTS_HPP
    #define VGL_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace vgl::core {

inline constexpr u32 kGenerationBits         = 12;
inline constexpr u32 kSlotBits               = 20;

inline constexpr u32 kDefaultInitialCapacity = 1'024;
inline constexpr u32 kMaxComponentKinds      = 64;

} // namespace vgl::core

#endif // VGL_CORE_CONSTANTS_HPP
