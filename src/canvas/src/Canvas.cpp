/**
 * @file Canvas.cpp
 * @brief Canvas implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/canvas/Canvas.hpp>
#include <plr/core/Assert.hpp>

#include <format>

namespace plr::canvas {

core::Expected<Canvas> Canvas::create(core::Coord width,
                                      core::Coord height,
                                      palette::Rgb8 background,
                                      palette::Palette palette)
{
    if (width == 0 || height == 0)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("canvas dimensions must be positive, got {}x{}", width, height));
    }
    if (palette.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "canvas palette is empty");
    }
    return Canvas{width, height, background, std::move(palette)};
}

Canvas::Canvas(core::Coord width, core::Coord height, palette::Rgb8 background,
               palette::Palette palette)
    : _width{width}
    , _height{height}
    , _background{background}
    , _palette{std::move(palette)}
    , _pixels(static_cast<core::usize>(width) * height, background)
{
}

core::ExpectedVoid Canvas::apply(const diff::PlacementEvent& event)
{
    if (event.x >= _width || event.y >= _height) [[unlikely]]
    {
        return core::makeError(core::ErrorCode::kMalformedRecord,
            std::format("pixel ({}, {}) at t={} outside {}x{} canvas",
                        event.x, event.y, event.timestamp, _width, _height));
    }

    const palette::Rgb8 color = PLR_TRY(_palette.resolve(event.color));
    _pixels[static_cast<core::usize>(event.y) * _width + event.x] = color;
    ++_applied;
    return {};
}

Snapshot Canvas::snapshot(SnapshotLabel label) const
{
    return Snapshot{label, _width, _height, _pixels};
}

palette::Rgb8 Canvas::at(core::Coord x, core::Coord y) const
{
    PLR_ASSERT(x < _width && y < _height);
    return _pixels[static_cast<core::usize>(y) * _width + x];
}

} // namespace plr::canvas
