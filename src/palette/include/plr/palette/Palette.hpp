/**
 * @file Palette.hpp
 * @brief Fixed color palette resolving diff color codes to RGB values.
 *
 * A Palette is an immutable value: it is built once (usually from the
 * archive's hex table) and captured by the replay configuration for the
 * whole run.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_PALETTE_PALETTE_HPP
    #define PLR_PALETTE_PALETTE_HPP

#include <plr/core/Types.hpp>
#include <plr/core/Expected.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace plr::palette {

/** @brief 8-bit per channel RGB color. */
struct Rgb8
{
    core::u8 r{0};
    core::u8 g{0};
    core::u8 b{0};

    [[nodiscard]] friend constexpr bool operator==(const Rgb8&, const Rgb8&) = default;
};

static_assert(sizeof(Rgb8) == 3, "Rgb8 must be tightly packed");

/**
 * @brief Parse a six digit hex color ("e50000"), with or without a leading '#'.
 * @return The color, or kInvalidArgument on a malformed string.
 */
[[nodiscard]] core::Expected<Rgb8> parseHexColor(std::string_view hex);

/**
 * @class Palette
 * @brief Lookup table from color code to Rgb8.
 */
class Palette
{
public:
    Palette() = default;
    explicit Palette(std::vector<Rgb8> colors);

    /**
     * @brief Build a palette from hex strings, code i being entry i.
     * @return The palette, or the first parse error.
     */
    [[nodiscard]] static core::Expected<Palette> fromHex(std::span<const std::string_view> hex);

    /**
     * @brief Resolve a color code.
     * @return The color, or kUnknownColorCode when @p code is outside the palette.
     */
    [[nodiscard]] core::Expected<Rgb8> resolve(core::ColorCode code) const;

    [[nodiscard]] bool contains(core::ColorCode code) const noexcept { return code < _colors.size(); }
    [[nodiscard]] core::usize size() const noexcept { return _colors.size(); }
    [[nodiscard]] bool empty() const noexcept { return _colors.empty(); }
    [[nodiscard]] std::span<const Rgb8> colors() const noexcept { return _colors; }

private:
    std::vector<Rgb8> _colors;
};

/**
 * @brief The 16-color palette the diff archive was recorded with.
 *
 * Code 0 is white and is the canvas background.
 */
[[nodiscard]] const Palette& archivePalette();

} // namespace plr::palette

#endif // PLR_PALETTE_PALETTE_HPP
