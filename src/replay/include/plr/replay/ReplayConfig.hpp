/**
 * @file ReplayConfig.hpp
 * @brief Replay configuration (Builder pattern).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_REPLAY_REPLAYCONFIG_HPP
    #define PLR_REPLAY_REPLAYCONFIG_HPP

#include <plr/palette/Palette.hpp>
#include <plr/core/Types.hpp>
#include <plr/core/Constants.hpp>

#include <set>

namespace plr::replay {

/** @brief Immutable replay configuration. */
class ReplayConfig
{
public:
    /** @brief Fluent builder for ReplayConfig. Defaults describe the archive. */
    class Builder
    {
    public:
        Builder& width(core::Coord w) noexcept;
        Builder& height(core::Coord h) noexcept;
        Builder& palette(plr::palette::Palette p);
        Builder& backgroundCode(core::ColorCode code) noexcept;
        Builder& chunkRecords(core::usize records) noexcept;

        /** @brief Consume cut points equal to @p timestamp without emitting them. */
        Builder& skipTimestamp(core::Timestamp timestamp);

        [[nodiscard]] ReplayConfig build() const;

    private:
        core::Coord               _width{core::kArchiveWidth};
        core::Coord               _height{core::kArchiveHeight};
        plr::palette::Palette     _palette{plr::palette::archivePalette()};
        core::ColorCode           _backgroundCode{core::kArchiveBackgroundCode};
        core::usize               _chunkRecords{core::kDefaultChunkRecords};
        std::set<core::Timestamp> _skipped;
    };

    [[nodiscard]] core::Coord             width()          const noexcept { return _width; }
    [[nodiscard]] core::Coord             height()         const noexcept { return _height; }
    [[nodiscard]] const plr::palette::Palette& palette() const noexcept { return _palette; }
    [[nodiscard]] core::ColorCode         backgroundCode() const noexcept { return _backgroundCode; }
    [[nodiscard]] core::usize             chunkRecords()   const noexcept { return _chunkRecords; }
    [[nodiscard]] bool isSkipped(core::Timestamp timestamp) const { return _skipped.contains(timestamp); }

private:
    friend class Builder;

    core::Coord               _width{core::kArchiveWidth};
    core::Coord               _height{core::kArchiveHeight};
    plr::palette::Palette     _palette{plr::palette::archivePalette()};
    core::ColorCode           _backgroundCode{core::kArchiveBackgroundCode};
    core::usize               _chunkRecords{core::kDefaultChunkRecords};
    std::set<core::Timestamp> _skipped;
};

} // namespace plr::replay

#endif // PLR_REPLAY_REPLAYCONFIG_HPP
