/**
 * @file PlacementEvent.hpp
 * @brief One decoded "place a pixel" event.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_DIFF_PLACEMENTEVENT_HPP
    #define PLR_DIFF_PLACEMENTEVENT_HPP

#include <plr/core/Types.hpp>

namespace plr::diff {

/** @brief Immutable placement event, in arrival order. */
struct PlacementEvent
{
    core::Timestamp timestamp{0};
    core::Coord     x{0};
    core::Coord     y{0};
    core::ColorCode color{0};

    [[nodiscard]] friend constexpr bool operator==(const PlacementEvent&, const PlacementEvent&) = default;
};

} // namespace plr::diff

#endif // PLR_DIFF_PLACEMENTEVENT_HPP
