/**
 * @file Constants.hpp
 * @brief Archive-wide compile-time constants.
 *
 * The diff archive replayed by PlaceReplay was captured from a single
 * fixed-size canvas; its geometry and the tuning knobs of the decoder are
 * centralised here.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CORE_CONSTANTS_HPP
    #define PLR_CORE_CONSTANTS_HPP

    #include "Types.hpp"

namespace plr::core {

inline constexpr Coord     kArchiveWidth          = 1000;
inline constexpr Coord     kArchiveHeight         = 1000;
inline constexpr ColorCode kArchiveBackgroundCode = 0;

/// First frame of the archive; the canvas is still blank at that instant.
inline constexpr Timestamp kArchiveBlankTimestamp = 1490986860;

/// Records pulled from the byte source per refill of the decoder buffer.
inline constexpr usize     kDefaultChunkRecords   = 4096;

/// Snapshots allowed to wait for a background sink worker.
inline constexpr usize     kDefaultSinkQueueDepth = 4;

} // namespace plr::core

#endif // PLR_CORE_CONSTANTS_HPP
