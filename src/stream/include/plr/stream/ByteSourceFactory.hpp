/**
 * @file ByteSourceFactory.hpp
 * @brief Opens the right byte source for a diff path.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_STREAM_BYTESOURCEFACTORY_HPP
    #define PLR_STREAM_BYTESOURCEFACTORY_HPP

#include <plr/stream/IByteSource.hpp>

#include <memory>
#include <string_view>

namespace plr::stream {

/** @brief How a diff file is stored on disk. */
enum class Compression : core::u8
{
    kAuto,  ///< gzip when the path ends in ".gz", plain otherwise
    kNone,
    kGzip
};

class ByteSourceFactory final {
public:
    ByteSourceFactory() = delete;

    /**
     * @brief Create and open a byte source for @p path.
     * @return The opened source, or the error raised by open().
     */
    [[nodiscard]] static core::Expected<std::unique_ptr<IByteSource>> open(
        std::string_view path, Compression compression = Compression::kAuto);

    /** @brief Compression inferred from the file name. */
    [[nodiscard]] static Compression detect(std::string_view path) noexcept;
};

} // namespace plr::stream

#endif // PLR_STREAM_BYTESOURCEFACTORY_HPP
