/**
 * @file Palette.cpp
 * @brief Palette implementation and the archive color table.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/palette/Palette.hpp>
#include <plr/core/Assert.hpp>

#include <array>
#include <charconv>
#include <format>
#include <string>

namespace plr::palette {

namespace {

constexpr std::array<std::string_view, 16> kArchiveHex = {
    "ffffff", "e4e4e4", "888888", "222222",
    "ffa7d1", "e50000", "e59500", "a06a42",
    "e5d900", "94e044", "02be01", "00d3dd",
    "0083c7", "0000ea", "cf6ee4", "820080",
};

core::Expected<core::u8> parseChannel(std::string_view digits)
{
    core::u8 value = 0;
    const auto* first = digits.data();
    const auto* last  = digits.data() + digits.size();
    auto [ptr, ec] = std::from_chars(first, last, value, 16);
    if (ec != std::errc{} || ptr != last)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("invalid hex channel '{}'", digits));
    }
    return value;
}

} // namespace

core::Expected<Rgb8> parseHexColor(std::string_view hex)
{
    if (!hex.empty() && hex.front() == '#')
        hex.remove_prefix(1);

    if (hex.size() != 6)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("hex color '{}' must have 6 digits", hex));
    }

    Rgb8 color;
    color.r = PLR_TRY(parseChannel(hex.substr(0, 2)));
    color.g = PLR_TRY(parseChannel(hex.substr(2, 2)));
    color.b = PLR_TRY(parseChannel(hex.substr(4, 2)));
    return color;
}

Palette::Palette(std::vector<Rgb8> colors)
    : _colors{std::move(colors)}
{
}

core::Expected<Palette> Palette::fromHex(std::span<const std::string_view> hex)
{
    std::vector<Rgb8> colors;
    colors.reserve(hex.size());
    for (auto entry : hex)
    {
        colors.push_back(PLR_TRY(parseHexColor(entry)));
    }
    return Palette{std::move(colors)};
}

core::Expected<Rgb8> Palette::resolve(core::ColorCode code) const
{
    if (!contains(code)) [[unlikely]]
    {
        return core::makeError(core::ErrorCode::kUnknownColorCode,
            std::format("color code {} outside palette of {} entries", code, _colors.size()));
    }
    return _colors[code];
}

const Palette& archivePalette()
{
    static const Palette palette = [] {
        auto built = Palette::fromHex(kArchiveHex);
        PLR_VERIFY(built.has_value());
        return std::move(*built);
    }();
    return palette;
}

} // namespace plr::palette
