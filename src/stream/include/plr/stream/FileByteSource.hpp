/**
 * @file FileByteSource.hpp
 * @brief Byte source reading an uncompressed diff file.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_STREAM_FILEBYTESOURCE_HPP
    #define PLR_STREAM_FILEBYTESOURCE_HPP

#include <plr/stream/IByteSource.hpp>

#include <fstream>
#include <string>

namespace plr::stream {

class FileByteSource final : public IByteSource {
public:
    explicit FileByteSource(std::string path);
    ~FileByteSource() override;

    [[nodiscard]] core::ExpectedVoid open() override;
    [[nodiscard]] core::Expected<core::usize> read(std::span<core::byte> buffer) override;
    void close() noexcept override;
    [[nodiscard]] std::string describe() const override;

private:
    std::string   _path;
    std::ifstream _file;
};

} // namespace plr::stream

#endif // PLR_STREAM_FILEBYTESOURCE_HPP
