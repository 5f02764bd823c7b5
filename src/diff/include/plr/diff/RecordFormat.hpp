/**
 * @file RecordFormat.hpp
 * @brief Frozen wire layout of the binary diff archive.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#pragma once

#ifndef PLR_DIFF_RECORDFORMAT_HPP
    #define PLR_DIFF_RECORDFORMAT_HPP

#include <plr/core/Types.hpp>

#include <span>

namespace plr::diff {

/** @brief Version of the record layout below. */
static constexpr core::u8 kFormatVersion = 1;

/**
 * @struct WireRecord
 * @brief One record as stored in the archive.
 *
 * Layout (16 bytes, every field unsigned 32-bit little-endian):
 *   [timestamp:4][x:4][y:4][color:4]
 *
 * Records are back to back with no delimiter.  A trailing remainder
 * shorter than kRecordSize is not a record.
 */
struct WireRecord
{
    core::u32 timestamp;
    core::u32 x;
    core::u32 y;
    core::u32 color;
};

static_assert(sizeof(WireRecord) == 16, "WireRecord must be 16 bytes");

static constexpr core::usize kFieldSize       = 4;
static constexpr core::usize kRecordSize      = sizeof(WireRecord);
static constexpr core::usize kTimestampOffset = 0;
static constexpr core::usize kXOffset         = 4;
static constexpr core::usize kYOffset         = 8;
static constexpr core::usize kColorOffset     = 12;

/** @brief Read a little-endian u32, independent of host byte order. */
[[nodiscard]] constexpr core::u32 loadLe32(std::span<const core::byte, kFieldSize> bytes) noexcept
{
    return  static_cast<core::u32>(bytes[0])
         | (static_cast<core::u32>(bytes[1]) << 8)
         | (static_cast<core::u32>(bytes[2]) << 16)
         | (static_cast<core::u32>(bytes[3]) << 24);
}

/** @brief Unpack one record from exactly kRecordSize bytes. */
[[nodiscard]] constexpr WireRecord unpackRecord(std::span<const core::byte, kRecordSize> bytes) noexcept
{
    return WireRecord{
        loadLe32(bytes.subspan<kTimestampOffset, kFieldSize>()),
        loadLe32(bytes.subspan<kXOffset, kFieldSize>()),
        loadLe32(bytes.subspan<kYOffset, kFieldSize>()),
        loadLe32(bytes.subspan<kColorOffset, kFieldSize>()),
    };
}

} // namespace plr::diff

#endif // PLR_DIFF_RECORDFORMAT_HPP
