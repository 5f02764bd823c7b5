/**
 * @file ReplayConfig.cpp
 * @brief ReplayConfig::Builder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/replay/ReplayConfig.hpp>

namespace plr::replay {

ReplayConfig::Builder& ReplayConfig::Builder::width(core::Coord w) noexcept
{
    _width = w;
    return *this;
}

ReplayConfig::Builder& ReplayConfig::Builder::height(core::Coord h) noexcept
{
    _height = h;
    return *this;
}

ReplayConfig::Builder& ReplayConfig::Builder::palette(plr::palette::Palette p)
{
    _palette = std::move(p);
    return *this;
}

ReplayConfig::Builder& ReplayConfig::Builder::backgroundCode(core::ColorCode code) noexcept
{
    _backgroundCode = code;
    return *this;
}

ReplayConfig::Builder& ReplayConfig::Builder::chunkRecords(core::usize records) noexcept
{
    _chunkRecords = records;
    return *this;
}

ReplayConfig::Builder& ReplayConfig::Builder::skipTimestamp(core::Timestamp timestamp)
{
    _skipped.insert(timestamp);
    return *this;
}

ReplayConfig ReplayConfig::Builder::build() const
{
    ReplayConfig cfg;
    cfg._width          = _width;
    cfg._height         = _height;
    cfg._palette        = _palette;
    cfg._backgroundCode = _backgroundCode;
    cfg._chunkRecords   = _chunkRecords;
    cfg._skipped        = _skipped;
    return cfg;
}

} // namespace plr::replay
