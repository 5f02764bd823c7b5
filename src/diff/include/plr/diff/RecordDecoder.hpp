/**
 * @file RecordDecoder.hpp
 * @brief Streaming decoder turning diff bytes into placement events.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_DIFF_RECORDDECODER_HPP
    #define PLR_DIFF_RECORDDECODER_HPP

#include <plr/diff/PlacementEvent.hpp>
#include <plr/diff/RecordFormat.hpp>
#include <plr/palette/Palette.hpp>
#include <plr/stream/IByteSource.hpp>
#include <plr/core/Constants.hpp>
#include <plr/core/NonCopyable.hpp>
#include <plr/core/Expected.hpp>

#include <optional>
#include <vector>

namespace plr::diff {

/**
 * @class RecordDecoder
 * @brief Forward-only cursor over the events of a byte source.
 *
 * Bytes are pulled in chunks of @p chunkRecords records so memory stays
 * bounded whatever the archive size.  Every record is validated against
 * the canvas geometry and the palette before it is handed out.
 *
 * A clean end of stream, including a trailing remainder shorter than one
 * record, yields std::nullopt.  A record with out-of-range coordinates or
 * color aborts decoding: the error carries the record's byte offset and
 * every later call returns kInvalidState.
 */
class RecordDecoder final : public core::NonCopyable<RecordDecoder>
{
public:
    /**
     * @param source       Opened byte source; must outlive the decoder.
     * @param width        Canvas width, x must be below it.
     * @param height       Canvas height, y must be below it.
     * @param palette      Palette the color codes must belong to.
     * @param chunkRecords Records buffered per refill (at least 1).
     */
    RecordDecoder(stream::IByteSource& source,
                  core::Coord width,
                  core::Coord height,
                  const palette::Palette& palette,
                  core::usize chunkRecords = core::kDefaultChunkRecords);

    /**
     * @brief Decode the next event.
     * @return The event, std::nullopt at end of stream, or an Error.
     */
    [[nodiscard]] core::Expected<std::optional<PlacementEvent>> next();

    /** @brief Byte offset of the record returned by the last next(). */
    [[nodiscard]] core::u64 lastRecordOffset() const noexcept { return _lastOffset; }

    /** @brief Bytes consumed as whole records so far. */
    [[nodiscard]] core::u64 bytesConsumed() const noexcept { return _consumed; }

    /** @brief Events handed out so far. */
    [[nodiscard]] core::u64 recordsDecoded() const noexcept { return _records; }

    /** @brief Size of the ignored trailing remainder, valid once finished. */
    [[nodiscard]] core::usize trailingBytes() const noexcept { return _trailing; }

    [[nodiscard]] bool finished() const noexcept { return _finished; }

private:
    core::ExpectedVoid refill();
    core::ExpectedVoid validate(const WireRecord& record, core::u64 offset) const;

    stream::IByteSource&     _source;
    core::Coord              _width;
    core::Coord              _height;
    const palette::Palette&  _palette;

    std::vector<core::byte>  _buffer;
    core::usize              _begin{0};
    core::usize              _end{0};
    bool                     _sourceDrained{false};

    core::u64                _consumed{0};
    core::u64                _lastOffset{0};
    core::u64                _records{0};
    core::usize              _trailing{0};
    bool                     _finished{false};
    bool                     _failed{false};
};

} // namespace plr::diff

#endif // PLR_DIFF_RECORDDECODER_HPP
