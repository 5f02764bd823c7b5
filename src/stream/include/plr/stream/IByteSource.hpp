/**
 * @file IByteSource.hpp
 * @brief Abstract forward-only byte stream feeding the diff decoder.
 *
 * Every transport (plain file, gzip file, in-memory buffer) implements
 * this interface.  Sources only deliver bytes: they know nothing about
 * record framing, which is the decoder's job.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_STREAM_IBYTESOURCE_HPP
    #define PLR_STREAM_IBYTESOURCE_HPP

#include <plr/core/Types.hpp>
#include <plr/core/Expected.hpp>

#include <span>
#include <string>

namespace plr::stream {

/**
 * @brief Forward-only readable byte stream.
 *
 * Contract:
 * 1. open() acquires the underlying resource. Must be called before read().
 * 2. read() blocks until at least one byte is available, the stream ends
 *    (returns 0), or an I/O error occurs.  It may return fewer bytes than
 *    requested.
 * 3. close() releases the resource (also done by the destructor).
 *
 * There is no seek or rewind: replaying again means opening a new source.
 */
class IByteSource {
public:
    virtual ~IByteSource() = default;

    IByteSource(const IByteSource &) = delete;
    IByteSource &operator=(const IByteSource &) = delete;
    IByteSource(IByteSource &&) = default;
    IByteSource &operator=(IByteSource &&) = default;

    /**
     * @brief Acquire the underlying resource.
     * @return void on success, or an Error describing the failure
     */
    [[nodiscard]] virtual core::ExpectedVoid open() = 0;

    /**
     * @brief Read up to buffer.size() bytes.
     * @param buffer Destination.
     * @return Number of bytes read, 0 at end of stream, or an Error
     */
    [[nodiscard]] virtual core::Expected<core::usize> read(std::span<core::byte> buffer) = 0;

    /** @brief Release the underlying resource. */
    virtual void close() noexcept = 0;

    /** @brief Human-readable description, used in logs. */
    [[nodiscard]] virtual std::string describe() const = 0;

protected:
    IByteSource() = default;
};

} // namespace plr::stream

#endif // PLR_STREAM_IBYTESOURCE_HPP
