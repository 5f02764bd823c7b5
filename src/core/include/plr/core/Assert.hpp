/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * PLR_ASSERT is debug-only, PLR_VERIFY is always evaluated and
 * PLR_UNREACHABLE marks provably dead code paths.  These guard programming
 * contracts only; malformed input is reported through core::Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CORE_ASSERT_HPP
    #define PLR_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace plr::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[PLR ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace plr::core::detail

    #ifdef PLR_DEBUG
        #define PLR_ASSERT(cond)                                          \
            do {                                                           \
                if (PLR_UNLIKELY(!(cond)))                                 \
                    ::plr::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define PLR_ASSERT(cond) ((void)0)
    #endif

    #define PLR_VERIFY(cond)                                              \
        do {                                                               \
            if (PLR_UNLIKELY(!(cond)))                                     \
                ::plr::core::detail::assertFail(#cond);                    \
        } while (false)

    #define PLR_UNREACHABLE()                                             \
        do {                                                               \
            ::plr::core::detail::assertFail("UNREACHABLE");                \
            __builtin_unreachable();                                       \
        } while (false)

#endif // PLR_CORE_ASSERT_HPP
