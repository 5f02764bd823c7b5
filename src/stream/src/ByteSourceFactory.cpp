/**
 * @file ByteSourceFactory.cpp
 * @brief Implementation of the ByteSourceFactory.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/stream/ByteSourceFactory.hpp>
#include <plr/stream/FileByteSource.hpp>
#include <plr/stream/GzipByteSource.hpp>
#include <plr/core/Log.hpp>

#include <format>
#include <string>

namespace plr::stream {

Compression ByteSourceFactory::detect(std::string_view path) noexcept
{
    return path.ends_with(".gz") ? Compression::kGzip : Compression::kNone;
}

core::Expected<std::unique_ptr<IByteSource>> ByteSourceFactory::open(
    std::string_view path, Compression compression)
{
    if (path.empty())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument, "empty diff path");
    }

    if (compression == Compression::kAuto)
        compression = detect(path);

    std::unique_ptr<IByteSource> source;
    switch (compression)
    {
        case Compression::kGzip:
            source = std::make_unique<GzipByteSource>(std::string{path});
            break;
        case Compression::kNone:
        case Compression::kAuto:
            source = std::make_unique<FileByteSource>(std::string{path});
            break;
    }

    PLR_TRY_VOID(source->open());
    core::Log::debug("stream", std::format("opened {}", source->describe()));
    return source;
}

} // namespace plr::stream
