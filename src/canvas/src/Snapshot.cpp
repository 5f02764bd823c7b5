/**
 * @file Snapshot.cpp
 * @brief Snapshot implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/canvas/Snapshot.hpp>
#include <plr/core/Assert.hpp>

namespace plr::canvas {

namespace {

constexpr core::u64 kFnvOffsetBasis = 14695981039346656037ULL;
constexpr core::u64 kFnvPrime       = 1099511628211ULL;

constexpr core::u64 fnvByte(core::u64 hash, core::u8 value) noexcept
{
    return (hash ^ value) * kFnvPrime;
}

constexpr core::u64 fnvU32(core::u64 hash, core::u32 value) noexcept
{
    for (int shift = 0; shift < 32; shift += 8)
        hash = fnvByte(hash, static_cast<core::u8>(value >> shift));
    return hash;
}

} // namespace

Snapshot::Snapshot(SnapshotLabel label, core::Coord width, core::Coord height,
                   std::vector<palette::Rgb8> pixels)
    : _label{label}
    , _width{width}
    , _height{height}
    , _pixels{std::move(pixels)}
{
    PLR_ASSERT(_pixels.size() == static_cast<core::usize>(width) * height);
}

palette::Rgb8 Snapshot::at(core::Coord x, core::Coord y) const
{
    PLR_ASSERT(x < _width && y < _height);
    return _pixels[static_cast<core::usize>(y) * _width + x];
}

std::span<const core::u8> Snapshot::rgbBytes() const noexcept
{
    return {reinterpret_cast<const core::u8 *>(_pixels.data()), _pixels.size() * sizeof(palette::Rgb8)};
}

core::u64 Snapshot::digest() const noexcept
{
    core::u64 hash = kFnvOffsetBasis;
    hash = fnvU32(hash, _width);
    hash = fnvU32(hash, _height);
    for (const auto px : _pixels)
    {
        hash = fnvByte(hash, px.r);
        hash = fnvByte(hash, px.g);
        hash = fnvByte(hash, px.b);
    }
    return hash;
}

bool Snapshot::samePixels(const Snapshot& other) const noexcept
{
    return _width == other._width && _height == other._height && _pixels == other._pixels;
}

} // namespace plr::canvas
