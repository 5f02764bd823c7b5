/**
 * @file FileByteSource.cpp
 * @brief Plain file byte source.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/stream/FileByteSource.hpp>

#include <filesystem>
#include <format>

namespace plr::stream {

FileByteSource::FileByteSource(std::string path)
    : _path(std::move(path))
{
}

FileByteSource::~FileByteSource()
{
    close();
}

core::ExpectedVoid FileByteSource::open()
{
    if (_file.is_open())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
            std::format("{} already open", _path));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(_path, ec))
    {
        return core::makeError(core::ErrorCode::kFileNotFound, _path);
    }

    _file.open(_path, std::ios::in | std::ios::binary);
    if (!_file.is_open())
    {
        return core::makeError(core::ErrorCode::kIoError,
            std::format("cannot open {}", _path));
    }
    return {};
}

core::Expected<core::usize> FileByteSource::read(std::span<core::byte> buffer)
{
    if (!_file.is_open())
    {
        return core::makeError(core::ErrorCode::kInvalidState,
            std::format("{} not opened", _path));
    }
    if (buffer.empty() || _file.eof())
        return core::usize{0};

    _file.read(reinterpret_cast<char *>(buffer.data()),
               static_cast<std::streamsize>(buffer.size()));
    if (_file.bad())
    {
        return core::makeError(core::ErrorCode::kIoError,
            std::format("read failure on {}", _path));
    }
    return static_cast<core::usize>(_file.gcount());
}

void FileByteSource::close() noexcept
{
    if (_file.is_open())
        _file.close();
}

std::string FileByteSource::describe() const
{
    return _path;
}

} // namespace plr::stream
