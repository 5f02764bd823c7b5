/**
 * @file ImageFileSink.hpp
 * @brief Sink writing each snapshot as an image file.
 *
 * Files are named after the snapshot's cut point
 * ("<dir>/<timestamp>.<ext>"), or after a fixed stem when one is set
 * ("<dir>/latest.png" for a Latest run).
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_SINK_IMAGEFILESINK_HPP
    #define PLR_SINK_IMAGEFILESINK_HPP

#include <plr/replay/ISnapshotSink.hpp>
#include <plr/core/Types.hpp>
#include <plr/core/Expected.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace plr::sink {

enum class ImageFormat : core::u8
{
    kPng,
    kBmp,
    kTga,
    kJpg
};

/** @brief Parse "png", "bmp", "tga", "jpg" or "jpeg" (case-insensitive). */
[[nodiscard]] core::Expected<ImageFormat> parseImageFormat(std::string_view name);

/** @brief File extension of @p format, without the dot. */
[[nodiscard]] std::string_view extensionOf(ImageFormat format) noexcept;

struct ImageFileSinkConfig
{
    std::filesystem::path      outputDir{"."};
    ImageFormat                format{ImageFormat::kPng};
    int                        jpgQuality{95};
    std::optional<std::string> fixedStem;
};

class ImageFileSink final : public replay::ISnapshotSink
{
public:
    /**
     * @brief Create the sink, creating the output directory if needed.
     * @return The sink, or kIoError when the directory cannot be created.
     */
    [[nodiscard]] static core::Expected<ImageFileSink> create(ImageFileSinkConfig config);

    [[nodiscard]] core::ExpectedVoid consume(canvas::Snapshot snapshot) override;

    /** @brief Path the snapshot labelled @p label goes to. */
    [[nodiscard]] std::filesystem::path pathFor(const canvas::SnapshotLabel& label) const;

    [[nodiscard]] core::u64 writtenCount() const noexcept { return _written; }

private:
    explicit ImageFileSink(ImageFileSinkConfig config);

    ImageFileSinkConfig _config;
    core::u64           _written{0};
};

} // namespace plr::sink

#endif // PLR_SINK_IMAGEFILESINK_HPP
