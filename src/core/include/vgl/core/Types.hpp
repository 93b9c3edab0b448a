/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every Vigil module.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_TYPES_HPP
    #define VGL_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace vgl::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using usize = std::size_t;

} // namespace vgl::core

#endif // VGL_CORE_TYPES_HPP
