/**
 * @file RecordDecoder.cpp
 * @brief RecordDecoder implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/diff/RecordDecoder.hpp>
#include <plr/core/Assert.hpp>
#include <plr/core/Log.hpp>

#include <algorithm>
#include <cstring>
#include <format>

namespace plr::diff {

RecordDecoder::RecordDecoder(stream::IByteSource& source,
                             core::Coord width,
                             core::Coord height,
                             const palette::Palette& palette,
                             core::usize chunkRecords)
    : _source{source}
    , _width{width}
    , _height{height}
    , _palette{palette}
    , _buffer(std::max<core::usize>(chunkRecords, 1) * kRecordSize)
{
}

core::Expected<std::optional<PlacementEvent>> RecordDecoder::next()
{
    if (_failed)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
            "decoder stopped after a malformed record");
    }
    if (_finished)
        return std::optional<PlacementEvent>{};

    if (_end - _begin < kRecordSize)
    {
        auto filled = refill();
        if (!filled)
        {
            _failed = true;
            return std::unexpected(std::move(filled.error()));
        }

        if (_end - _begin < kRecordSize)
        {
            _finished = true;
            _trailing = _end - _begin;
            if (_trailing > 0)
            {
                core::Log::debug("diff", std::format(
                    "ignoring {} trailing bytes after offset {}", _trailing, _consumed));
            }
            return std::optional<PlacementEvent>{};
        }
    }

    const std::span<const core::byte, kRecordSize> bytes{_buffer.data() + _begin, kRecordSize};
    const WireRecord record = unpackRecord(bytes);
    const core::u64 offset = _consumed;

    if (auto valid = validate(record, offset); !valid)
    {
        _failed = true;
        return std::unexpected(std::move(valid.error()));
    }

    _begin      += kRecordSize;
    _consumed   += kRecordSize;
    _lastOffset  = offset;
    ++_records;

    return std::optional<PlacementEvent>{PlacementEvent{
        .timestamp = record.timestamp,
        .x         = record.x,
        .y         = record.y,
        .color     = record.color,
    }};
}

core::ExpectedVoid RecordDecoder::refill()
{
    // Slide the partial record, if any, to the front of the buffer.
    const core::usize pending = _end - _begin;
    if (pending > 0 && _begin > 0)
        std::memmove(_buffer.data(), _buffer.data() + _begin, pending);
    _begin = 0;
    _end   = pending;

    // Sources may return short reads; keep pulling until a whole chunk or EOF.
    while (!_sourceDrained && _end < _buffer.size())
    {
        auto got = _source.read(std::span<core::byte>{_buffer.data() + _end, _buffer.size() - _end});
        if (!got)
        {
            core::Error err = std::move(got.error());
            err.atOffset(_consumed + _end);
            return std::unexpected(std::move(err));
        }
        if (*got == 0)
        {
            _sourceDrained = true;
            break;
        }
        _end += *got;
    }
    return {};
}

core::ExpectedVoid RecordDecoder::validate(const WireRecord& record, core::u64 offset) const
{
    if (record.x >= _width || record.y >= _height) [[unlikely]]
    {
        return core::makeRecordError(core::ErrorCode::kMalformedRecord,
            std::format("pixel ({}, {}) outside {}x{} canvas", record.x, record.y, _width, _height),
            offset);
    }
    if (!_palette.contains(record.color)) [[unlikely]]
    {
        return core::makeRecordError(core::ErrorCode::kUnknownColorCode,
            std::format("color code {} outside palette of {} entries", record.color, _palette.size()),
            offset);
    }
    return {};
}

} // namespace plr::diff
