/**
 * @file Platform.hpp
 * @brief Compiler portability macros (branch-prediction hint).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CORE_PLATFORM_HPP
    #define PLR_CORE_PLATFORM_HPP

    #if defined(__GNUC__) || defined(__clang__)
        #define PLR_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #else
        #define PLR_UNLIKELY(x) (x)
    #endif

#endif // PLR_CORE_PLATFORM_HPP
