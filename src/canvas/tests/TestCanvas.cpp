/**
 * @file TestCanvas.cpp
 * @brief Unit tests for canvas::Canvas and canvas::Snapshot.
 */

#include <catch2/catch_test_macros.hpp>

#include "plr/canvas/Canvas.hpp"

namespace plr::canvas {

namespace {

constexpr palette::Rgb8 kWhite{0xFF, 0xFF, 0xFF};

Canvas makeCanvas(core::Coord w, core::Coord h)
{
    auto created = Canvas::create(w, h, kWhite, palette::archivePalette());
    REQUIRE(created.has_value());
    return std::move(*created);
}

} // namespace

TEST_CASE("New canvas is filled with the background", "[canvas]")
{
    Canvas grid = makeCanvas(3, 2);

    REQUIRE(grid.width() == 3);
    REQUIRE(grid.height() == 2);
    for (core::Coord y = 0; y < 2; ++y)
        for (core::Coord x = 0; x < 3; ++x)
            REQUIRE(grid.at(x, y) == kWhite);
}

TEST_CASE("Canvas rejects degenerate geometry", "[canvas]")
{
    REQUIRE(Canvas::create(0, 10, kWhite, palette::archivePalette()).error().code()
            == core::ErrorCode::kInvalidArgument);
    REQUIRE(Canvas::create(10, 10, kWhite, palette::Palette{}).error().code()
            == core::ErrorCode::kInvalidArgument);
}

TEST_CASE("Later placements overwrite earlier ones", "[canvas]")
{
    Canvas grid = makeCanvas(2, 2);
    const palette::Palette &p = palette::archivePalette();

    REQUIRE(grid.apply({100, 1, 0, 5}).has_value());
    REQUIRE(grid.apply({101, 1, 0, 12}).has_value());

    REQUIRE(grid.at(1, 0) == *p.resolve(12));
    REQUIRE(grid.at(0, 0) == kWhite);
    REQUIRE(grid.appliedCount() == 2);
}

TEST_CASE("Invalid placements leave the canvas untouched", "[canvas]")
{
    Canvas grid = makeCanvas(2, 2);

    auto outside = grid.apply({100, 2, 0, 1});
    REQUIRE(outside.error().code() == core::ErrorCode::kMalformedRecord);

    auto badColor = grid.apply({100, 0, 0, 99});
    REQUIRE(badColor.error().code() == core::ErrorCode::kUnknownColorCode);

    REQUIRE(grid.appliedCount() == 0);
    REQUIRE(grid.at(0, 0) == kWhite);
}

TEST_CASE("Snapshot is independent of later mutations", "[canvas][snapshot]")
{
    Canvas grid = makeCanvas(2, 2);
    REQUIRE(grid.apply({100, 0, 1, 3}).has_value());

    const Snapshot before = grid.snapshot({100, 0});
    REQUIRE(grid.apply({200, 0, 1, 6}).has_value());

    REQUIRE(before.at(0, 1) == *palette::archivePalette().resolve(3));
    REQUIRE(grid.at(0, 1) == *palette::archivePalette().resolve(6));
    REQUIRE(before.label() == SnapshotLabel{100, 0});
}

TEST_CASE("Snapshot pixels are row-major RGB", "[canvas][snapshot]")
{
    Canvas grid = makeCanvas(2, 2);
    REQUIRE(grid.apply({1, 1, 0, 3}).has_value());

    const Snapshot shot = grid.snapshot({1, 0});
    const auto rgb = shot.rgbBytes();

    REQUIRE(rgb.size() == 12);
    REQUIRE(rgb[0] == 0xFF);
    REQUIRE(rgb[3] == 0x22);
    REQUIRE(rgb[4] == 0x22);
    REQUIRE(rgb[5] == 0x22);
}

TEST_CASE("Digest ignores the label and tracks pixels", "[canvas][snapshot]")
{
    Canvas grid = makeCanvas(4, 4);

    const Snapshot a = grid.snapshot({10, 0});
    const Snapshot b = grid.snapshot({20, 1});
    REQUIRE(a.digest() == b.digest());
    REQUIRE(a.samePixels(b));

    REQUIRE(grid.apply({30, 3, 3, 2}).has_value());
    const Snapshot c = grid.snapshot({30, 2});
    REQUIRE(c.digest() != a.digest());
    REQUIRE_FALSE(c.samePixels(a));
}

} // namespace plr::canvas
