/**
 * @file ImageFileSink.cpp
 * @brief ImageFileSink implementation on top of stb_image_write.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <plr/sink/ImageFileSink.hpp>
#include <plr/core/Log.hpp>

#include <algorithm>
#include <cctype>
#include <format>
#include <string>

namespace plr::sink {

core::Expected<ImageFormat> parseImageFormat(std::string_view name)
{
    std::string lower{name};
    std::ranges::transform(lower, lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "png")                    return ImageFormat::kPng;
    if (lower == "bmp")                    return ImageFormat::kBmp;
    if (lower == "tga")                    return ImageFormat::kTga;
    if (lower == "jpg" || lower == "jpeg") return ImageFormat::kJpg;

    return core::makeError(core::ErrorCode::kInvalidArgument,
        std::format("unsupported image format '{}'", name));
}

std::string_view extensionOf(ImageFormat format) noexcept
{
    switch (format)
    {
        case ImageFormat::kPng: return "png";
        case ImageFormat::kBmp: return "bmp";
        case ImageFormat::kTga: return "tga";
        case ImageFormat::kJpg: return "jpg";
    }
    return "png";
}

core::Expected<ImageFileSink> ImageFileSink::create(ImageFileSinkConfig config)
{
    std::error_code ec;
    std::filesystem::create_directories(config.outputDir, ec);
    if (ec)
    {
        return core::makeError(core::ErrorCode::kIoError,
            std::format("cannot create {}: {}", config.outputDir.string(), ec.message()));
    }
    return ImageFileSink{std::move(config)};
}

ImageFileSink::ImageFileSink(ImageFileSinkConfig config)
    : _config{std::move(config)}
{
}

std::filesystem::path ImageFileSink::pathFor(const canvas::SnapshotLabel& label) const
{
    const std::string stem = _config.fixedStem ? *_config.fixedStem : std::to_string(label.timestamp);
    return _config.outputDir / std::format("{}.{}", stem, extensionOf(_config.format));
}

core::ExpectedVoid ImageFileSink::consume(canvas::Snapshot snapshot)
{
    const std::filesystem::path path = pathFor(snapshot.label());
    const std::string file = path.string();
    core::Log::info("sink", std::format("Storing {}", file));

    const int w = static_cast<int>(snapshot.width());
    const int h = static_cast<int>(snapshot.height());
    const void *rgb = snapshot.rgbBytes().data();

    int ok = 0;
    switch (_config.format)
    {
        case ImageFormat::kPng: ok = stbi_write_png(file.c_str(), w, h, 3, rgb, w * 3); break;
        case ImageFormat::kBmp: ok = stbi_write_bmp(file.c_str(), w, h, 3, rgb); break;
        case ImageFormat::kTga: ok = stbi_write_tga(file.c_str(), w, h, 3, rgb); break;
        case ImageFormat::kJpg: ok = stbi_write_jpg(file.c_str(), w, h, 3, rgb, _config.jpgQuality); break;
    }

    if (ok == 0)
    {
        return core::makeError(core::ErrorCode::kSinkFailed,
            std::format("failed to write {}", file));
    }
    ++_written;
    return {};
}

} // namespace plr::sink
