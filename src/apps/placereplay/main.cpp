// /////////////////////////////////////////////////////////////////////////////
/// @file main.cpp
/// @brief PlaceReplay command-line entry-point.
///
/// Replays a binary diff archive and stores the canvas at the requested
/// cut points:
///
///   placereplay DIFF [-o DIR] [-f FORMAT] (--latest | --interval N | --timestamp T...)
///               [--digest] [--keep-blank] [--async] [-v]
// /////////////////////////////////////////////////////////////////////////////

#include <plr/replay/ReplayDriver.hpp>
#include <plr/sink/DigestSink.hpp>
#include <plr/sink/ImageFileSink.hpp>
#include <plr/sink/QueuedSnapshotSink.hpp>
#include <plr/stream/ByteSourceFactory.hpp>
#include <plr/core/Constants.hpp>
#include <plr/core/Log.hpp>

#include <charconv>
#include <cstdio>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace plr;

namespace {

enum class CutMode : core::u8 { kNone, kLatest, kInterval, kTimestamps };

struct Options
{
    std::string                  diffPath;
    std::string                  outputDir{"."};
    std::string                  format{"png"};
    CutMode                      mode{CutMode::kNone};
    core::u64                    interval{0};
    std::vector<core::Timestamp> timestamps;
    bool                         digest{false};
    bool                         keepBlank{false};
    bool                         async{false};
    bool                         verbose{false};
    bool                         help{false};
};

constexpr std::string_view kUsage =
    "usage: placereplay DIFF [-o DIR] [-f FORMAT] (--latest | --interval N | --timestamp T...)\n"
    "                   [--digest] [--keep-blank] [--async] [-v]\n"
    "\n"
    "  DIFF               binary diff archive (.gz is decompressed on the fly)\n"
    "  -o, --output-dir   directory for the images (default: .)\n"
    "  -f, --format       png, bmp, tga or jpg (default: png)\n"
    "  --latest           store only the final canvas as latest.<format>\n"
    "  --interval N       store a frame every N seconds (0: every timestamp)\n"
    "  --timestamp T      store the canvas at T; may be repeated\n"
    "  --digest           print a digest per frame instead of writing images\n"
    "  --keep-blank       do not skip the blank first frame of the archive\n"
    "  --async            write images from a background thread\n"
    "  -v, --verbose      debug logging\n";

core::Expected<core::u64> parseUnsigned(std::string_view flag, std::string_view text)
{
    core::u64 value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size())
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            std::format("{} expects a non-negative integer, got '{}'", flag, text));
    }
    return value;
}

core::ExpectedVoid selectMode(Options &opts, CutMode mode)
{
    if (opts.mode != CutMode::kNone && opts.mode != mode)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "--latest, --interval and --timestamp are mutually exclusive");
    }
    opts.mode = mode;
    return {};
}

core::Expected<Options> parseArgs(int argc, char *argv[])
{
    Options opts;

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg{argv[i]};

        auto value = [&]() -> core::Expected<std::string_view> {
            if (i + 1 >= argc)
                return core::makeError(core::ErrorCode::kInvalidArgument,
                    std::format("{} expects a value", arg));
            return std::string_view{argv[++i]};
        };

        if (arg == "-h" || arg == "--help")
        {
            opts.help = true;
        }
        else if (arg == "-o" || arg == "--output-dir")
        {
            opts.outputDir = PLR_TRY(value());
        }
        else if (arg == "-f" || arg == "--format")
        {
            opts.format = PLR_TRY(value());
        }
        else if (arg == "--latest")
        {
            PLR_TRY_VOID(selectMode(opts, CutMode::kLatest));
        }
        else if (arg == "--interval")
        {
            PLR_TRY_VOID(selectMode(opts, CutMode::kInterval));
            const std::string_view text = PLR_TRY(value());
            opts.interval = PLR_TRY(parseUnsigned(arg, text));
        }
        else if (arg == "--timestamp")
        {
            PLR_TRY_VOID(selectMode(opts, CutMode::kTimestamps));
            const std::string_view text = PLR_TRY(value());
            opts.timestamps.push_back(PLR_TRY(parseUnsigned(arg, text)));
        }
        else if (arg == "--digest")
        {
            opts.digest = true;
        }
        else if (arg == "--keep-blank")
        {
            opts.keepBlank = true;
        }
        else if (arg == "--async")
        {
            opts.async = true;
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            opts.verbose = true;
        }
        else if (arg.starts_with("-") && arg.size() > 1)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("unknown option '{}'", arg));
        }
        else if (opts.diffPath.empty())
        {
            opts.diffPath = std::string{arg};
        }
        else
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                std::format("unexpected argument '{}'", arg));
        }
    }

    if (opts.help)
        return opts;

    if (opts.diffPath.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "missing DIFF argument");
    if (opts.mode == CutMode::kNone)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
            "one of --latest, --interval or --timestamp is required");
    }
    return opts;
}

replay::CutRequest toRequest(const Options &opts)
{
    switch (opts.mode)
    {
        case CutMode::kInterval:   return replay::CutRequest::interval(opts.interval);
        case CutMode::kTimestamps: return replay::CutRequest::timestamps(opts.timestamps);
        case CutMode::kLatest:
        case CutMode::kNone:       break;
    }
    return replay::CutRequest::latest();
}

core::Expected<replay::ReplaySummary> runWith(const Options &opts, replay::ISnapshotSink &output)
{
    auto builder = replay::ReplayConfig::Builder{};
    if (!opts.keepBlank)
        builder.skipTimestamp(core::kArchiveBlankTimestamp);

    auto source = PLR_TRY(stream::ByteSourceFactory::open(opts.diffPath));
    const replay::ReplayDriver driver{builder.build()};

    if (!opts.async)
        return driver.run(*source, toRequest(opts), output);

    sink::QueuedSnapshotSink queued{output};
    return driver.run(*source, toRequest(opts), queued);
}

core::Expected<replay::ReplaySummary> execute(const Options &opts)
{
    if (opts.digest)
    {
        sink::DigestSink digest{std::cout};
        return runWith(opts, digest);
    }

    sink::ImageFileSinkConfig imageConfig;
    imageConfig.outputDir = opts.outputDir;
    imageConfig.format    = PLR_TRY(sink::parseImageFormat(opts.format));
    if (opts.mode == CutMode::kLatest)
        imageConfig.fixedStem = "latest";

    auto images = PLR_TRY(sink::ImageFileSink::create(std::move(imageConfig)));
    return runWith(opts, images);
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    auto parsed = parseArgs(argc, argv);
    if (!parsed)
    {
        core::Log::error("cli", parsed.error().message());
        std::fputs(kUsage.data(), stderr);
        return 2;
    }

    const Options &opts = *parsed;
    if (opts.help)
    {
        std::fputs(kUsage.data(), stdout);
        return 0;
    }

    if (opts.verbose)
        core::Log::setMinLevel(core::LogLevel::kDebug);

    auto summary = execute(opts);
    if (!summary)
    {
        core::Log::error("cli", summary.error().describe());
        return 1;
    }

    if (summary->empty())
    {
        const core::Error err{core::ErrorCode::kEmptyStream,
                              std::format("{} holds no placement", opts.diffPath)};
        core::Log::error("cli", err.describe());
        return 1;
    }
    return 0;
}
