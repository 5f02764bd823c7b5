/**
 * @file GzipByteSource.cpp
 * @brief zlib-backed gzip byte source.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/stream/GzipByteSource.hpp>

#include <zlib.h>

#include <algorithm>
#include <climits>
#include <filesystem>
#include <format>

namespace plr::stream {

namespace {

constexpr unsigned kInflateBufferSize = 128 * 1024;

gzFile asGz(void *handle) { return static_cast<gzFile>(handle); }

} // namespace

GzipByteSource::GzipByteSource(std::string path)
    : _path(std::move(path))
{
}

GzipByteSource::~GzipByteSource()
{
    close();
}

core::ExpectedVoid GzipByteSource::open()
{
    if (_handle != nullptr)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
            std::format("{} already open", _path));
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(_path, ec))
    {
        return core::makeError(core::ErrorCode::kFileNotFound, _path);
    }

    gzFile file = gzopen(_path.c_str(), "rb");
    if (file == nullptr)
    {
        return core::makeError(core::ErrorCode::kIoError,
            std::format("gzopen failed for {}", _path));
    }
    gzbuffer(file, kInflateBufferSize);

    _handle = file;
    return {};
}

core::Expected<core::usize> GzipByteSource::read(std::span<core::byte> buffer)
{
    if (_handle == nullptr)
    {
        return core::makeError(core::ErrorCode::kInvalidState,
            std::format("{} not opened", _path));
    }
    if (buffer.empty())
        return core::usize{0};

    const auto request = static_cast<unsigned>(
        std::min<core::usize>(buffer.size(), static_cast<core::usize>(INT_MAX)));
    const int got = gzread(asGz(_handle), buffer.data(), request);

    // A truncated stream ends with 0 bytes read and Z_BUF_ERROR recorded,
    // so end of file is only clean when zlib holds no error.
    if (got <= 0)
    {
        int errnum = Z_OK;
        const char *what = gzerror(asGz(_handle), &errnum);
        if (got < 0 || errnum != Z_OK)
        {
            return core::makeError(core::ErrorCode::kDecompressionFailed,
                std::format("{}: {}", _path, (what && *what) ? what : "gzread failed"));
        }
    }
    return static_cast<core::usize>(got);
}

void GzipByteSource::close() noexcept
{
    if (_handle != nullptr)
    {
        gzclose(asGz(_handle));
        _handle = nullptr;
    }
}

std::string GzipByteSource::describe() const
{
    return std::format("{} (gzip)", _path);
}

} // namespace plr::stream
