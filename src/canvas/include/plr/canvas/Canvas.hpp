/**
 * @file Canvas.hpp
 * @brief Mutable pixel grid replayed one placement event at a time.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_CANVAS_CANVAS_HPP
    #define PLR_CANVAS_CANVAS_HPP

#include <plr/canvas/Snapshot.hpp>
#include <plr/diff/PlacementEvent.hpp>
#include <plr/palette/Palette.hpp>
#include <plr/core/NonCopyable.hpp>
#include <plr/core/Expected.hpp>

#include <vector>

namespace plr::canvas {

/**
 * @class Canvas
 * @brief Single-owner grid of resolved colors.
 *
 * One Canvas belongs to one replay run.  It is movable but not copyable:
 * the only way to share its content is snapshot(), which deep-copies.
 */
class Canvas final : public core::NonCopyable<Canvas>
{
public:
    /**
     * @brief Build a canvas filled with @p background.
     * @return The canvas, or kInvalidArgument for a zero dimension.
     */
    [[nodiscard]] static core::Expected<Canvas> create(core::Coord width,
                                                       core::Coord height,
                                                       palette::Rgb8 background,
                                                       palette::Palette palette);

    /**
     * @brief Paint one event.
     *
     * Out-of-range coordinates are rejected with kMalformedRecord and an
     * unknown code with kUnknownColorCode; the canvas is left untouched.
     * Repeated placements on a cell overwrite it (last applied wins).
     */
    [[nodiscard]] core::ExpectedVoid apply(const diff::PlacementEvent& event);

    /** @brief Independent copy of the whole grid. */
    [[nodiscard]] Snapshot snapshot(SnapshotLabel label) const;

    /** @brief Color at (x, y); coordinates must be in range. */
    [[nodiscard]] palette::Rgb8 at(core::Coord x, core::Coord y) const;

    [[nodiscard]] core::Coord width()  const noexcept { return _width; }
    [[nodiscard]] core::Coord height() const noexcept { return _height; }
    [[nodiscard]] palette::Rgb8 background() const noexcept { return _background; }
    [[nodiscard]] core::u64 appliedCount() const noexcept { return _applied; }

private:
    Canvas(core::Coord width, core::Coord height, palette::Rgb8 background,
           palette::Palette palette);

    core::Coord                _width;
    core::Coord                _height;
    palette::Rgb8              _background;
    palette::Palette           _palette;
    std::vector<palette::Rgb8> _pixels;
    core::u64                  _applied{0};
};

} // namespace plr::canvas

#endif // PLR_CANVAS_CANVAS_HPP
