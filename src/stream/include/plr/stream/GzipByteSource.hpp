/**
 * @file GzipByteSource.hpp
 * @brief Byte source inflating a gzip-compressed diff file through zlib.
 *
 * The decoder never sees compressed bytes: inflation happens here, one
 * read() at a time, so memory stays bounded by the caller's buffer.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_STREAM_GZIPBYTESOURCE_HPP
    #define PLR_STREAM_GZIPBYTESOURCE_HPP

#include <plr/stream/IByteSource.hpp>

#include <string>

namespace plr::stream {

class GzipByteSource final : public IByteSource {
public:
    explicit GzipByteSource(std::string path);
    ~GzipByteSource() override;

    [[nodiscard]] core::ExpectedVoid open() override;
    [[nodiscard]] core::Expected<core::usize> read(std::span<core::byte> buffer) override;
    void close() noexcept override;
    [[nodiscard]] std::string describe() const override;

private:
    std::string _path;
    void       *_handle{nullptr};  // gzFile; kept opaque so zlib.h stays private
};

} // namespace plr::stream

#endif // PLR_STREAM_GZIPBYTESOURCE_HPP
