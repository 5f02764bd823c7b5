/**
 * @file Types.hpp
 * @brief Primitive type aliases shared by every PlaceReplay module.
 *
 * Provides fixed-width integer aliases and the timestamp / coordinate
 * types used by the diff decoder and the replay engine.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CORE_TYPES_HPP
    #define PLR_CORE_TYPES_HPP

    #include <cstddef>
    #include <cstdint>

namespace plr::core {

using u8  = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i32 = std::int32_t;
using i64 = std::int64_t;

using usize = std::size_t;

using byte = std::byte;

/// @brief Seconds since the Unix epoch, as stored in the diff archive.
using Timestamp = u64;

/// @brief Column / row index on the canvas.
using Coord = u32;

/// @brief Raw palette index as encoded in a diff record.
using ColorCode = u32;

} // namespace plr::core

#endif // PLR_CORE_TYPES_HPP
