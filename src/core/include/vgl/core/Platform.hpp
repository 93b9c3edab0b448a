/**
 * @file Platform.hpp
 * @brief Branch-prediction hint used by the contract macros.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef VGL_CORE_PLATFORM_HPP
    #define VGL_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define VGL_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define VGL_UNLIKELY(x) (x)
    #endif

#endif // VGL_CORE_PLATFORM_HPP
