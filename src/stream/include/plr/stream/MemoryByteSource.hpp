/**
 * @file MemoryByteSource.hpp
 * @brief Byte source serving an in-memory buffer.
 *
 * Used to replay diffs that are already decoded in memory and by the test
 * suites.  @p maxReadSize caps each read() to exercise partial reads.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_STREAM_MEMORYBYTESOURCE_HPP
    #define PLR_STREAM_MEMORYBYTESOURCE_HPP

#include <plr/stream/IByteSource.hpp>

#include <vector>

namespace plr::stream {

class MemoryByteSource final : public IByteSource {
public:
    explicit MemoryByteSource(std::vector<core::byte> data, core::usize maxReadSize = 0);

    [[nodiscard]] core::ExpectedVoid open() override;
    [[nodiscard]] core::Expected<core::usize> read(std::span<core::byte> buffer) override;
    void close() noexcept override;
    [[nodiscard]] std::string describe() const override;

    /** @brief Bytes handed out so far. */
    [[nodiscard]] core::usize cursor() const noexcept { return _cursor; }

private:
    std::vector<core::byte> _data;
    core::usize             _maxReadSize;
    core::usize             _cursor{0};
    bool                    _open{false};
};

} // namespace plr::stream

#endif // PLR_STREAM_MEMORYBYTESOURCE_HPP
