/**
 * @file Snapshot.hpp
 * @brief Immutable, fully materialized copy of the canvas at a cut point.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CANVAS_SNAPSHOT_HPP
    #define PLR_CANVAS_SNAPSHOT_HPP

#include <plr/palette/Palette.hpp>
#include <plr/core/Types.hpp>

#include <span>
#include <vector>

namespace plr::canvas {

/** @brief Name of a snapshot: the cut point and its emission rank. */
struct SnapshotLabel
{
    core::Timestamp timestamp{0};
    core::u64       index{0};

    [[nodiscard]] friend constexpr bool operator==(const SnapshotLabel&, const SnapshotLabel&) = default;
};

/**
 * @class Snapshot
 * @brief Owns its pixels; later canvas mutations never reach it.
 *
 * Pixels are row-major, (x, y) living at y * width + x.
 */
class Snapshot
{
public:
    Snapshot(SnapshotLabel label, core::Coord width, core::Coord height,
             std::vector<palette::Rgb8> pixels);

    [[nodiscard]] const SnapshotLabel& label() const noexcept { return _label; }
    [[nodiscard]] core::Timestamp timestamp() const noexcept { return _label.timestamp; }
    [[nodiscard]] core::Coord width()  const noexcept { return _width; }
    [[nodiscard]] core::Coord height() const noexcept { return _height; }

    /** @brief Color at (x, y); coordinates must be in range. */
    [[nodiscard]] palette::Rgb8 at(core::Coord x, core::Coord y) const;

    [[nodiscard]] std::span<const palette::Rgb8> pixels() const noexcept { return _pixels; }

    /** @brief Pixels as packed RGB bytes (3 per pixel), ready for an image encoder. */
    [[nodiscard]] std::span<const core::u8> rgbBytes() const noexcept;

    /**
     * @brief 64-bit FNV-1a digest of the geometry and pixels.
     *
     * The label is not hashed: two snapshots of identical canvases share a
     * digest whatever their cut point.
     */
    [[nodiscard]] core::u64 digest() const noexcept;

    /** @brief Same geometry and pixels, labels ignored. */
    [[nodiscard]] bool samePixels(const Snapshot& other) const noexcept;

private:
    SnapshotLabel              _label;
    core::Coord                _width;
    core::Coord                _height;
    std::vector<palette::Rgb8> _pixels;
};

} // namespace plr::canvas

#endif // PLR_CANVAS_SNAPSHOT_HPP
