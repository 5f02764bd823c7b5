/**
 * @file Expected.hpp
 * @brief Monadic error-handling type built on std::expected.
 *
 * Provides Expected<T> as an alias for std::expected<T, Error> and the
 * PLR_TRY / PLR_TRY_VOID macros for early-return propagation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CORE_EXPECTED_HPP
    #define PLR_CORE_EXPECTED_HPP

    #include "Error.hpp"

    #include <expected>

namespace plr::core {

/**
 * @brief Alias for an expected value or a structured Error.
 * @tparam T The success-path value type.
 */
template <typename T>
using Expected = std::expected<T, Error>;

/**
 * @brief Alias for operations that succeed with no value.
 */
using ExpectedVoid = Expected<void>;

} // namespace plr::core

/**
 * @brief Propagate an error from an Expected expression.
 *
 * Evaluates @p expr once.  If the result holds an error, the enclosing
 * function immediately returns that error wrapped in an unexpected.
 * Otherwise the macro yields the contained value.
 *
 * @param expr An expression of type plr::core::Expected<U>.
 */
#define PLR_TRY(expr)                                                     \
    ({                                                                     \
        auto &&_plr_result = (expr);                                       \
        if (!_plr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_plr_result.error()));         \
        std::move(_plr_result.value());                                    \
    })

/**
 * @brief Propagate an error from an ExpectedVoid expression.
 * @param expr An expression of type plr::core::ExpectedVoid.
 */
#define PLR_TRY_VOID(expr)                                                \
    do {                                                                    \
        auto &&_plr_result = (expr);                                       \
        if (!_plr_result.has_value()) [[unlikely]]                         \
            return std::unexpected(std::move(_plr_result.error()));         \
    } while (false)

#endif // PLR_CORE_EXPECTED_HPP
