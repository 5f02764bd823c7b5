/**
 * @file ReplayDriver.cpp
 * @brief ReplayDriver implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/replay/ReplayDriver.hpp>
#include <plr/replay/CollectingSink.hpp>
#include <plr/replay/CutSchedule.hpp>
#include <plr/canvas/Canvas.hpp>
#include <plr/diff/RecordDecoder.hpp>
#include <plr/core/Log.hpp>

#include <algorithm>
#include <format>

namespace plr::replay {

namespace {

/// Emits snapshots of one run's canvas, numbering them and honouring skips.
class Emitter
{
public:
    Emitter(const canvas::Canvas& canvas, const ReplayConfig& config,
            ISnapshotSink& sink, ReplaySummary& summary)
        : _canvas{canvas}, _config{config}, _sink{sink}, _summary{summary}
    {
    }

    core::ExpectedVoid emit(core::Timestamp target)
    {
        if (_config.isSkipped(target))
        {
            ++_summary.skippedCount;
            core::Log::debug("replay", std::format("skipping cut at {}", target));
            return {};
        }

        const canvas::SnapshotLabel label{target, _summary.snapshotCount};
        auto stored = _sink.consume(_canvas.snapshot(label));
        if (!stored)
        {
            const core::Error& cause = stored.error();
            return core::makeError(cause.code(),
                std::format("snapshot at {} not stored: {}", target, cause.message()));
        }
        ++_summary.snapshotCount;
        return {};
    }

private:
    const canvas::Canvas& _canvas;
    const ReplayConfig&   _config;
    ISnapshotSink&        _sink;
    ReplaySummary&        _summary;
};

} // namespace

ReplayDriver::ReplayDriver(ReplayConfig config)
    : _config{std::move(config)}
{
}

core::Expected<ReplaySummary> ReplayDriver::run(stream::IByteSource& source,
                                                const CutRequest& request,
                                                ISnapshotSink& sink) const
{
    const palette::Rgb8 background = PLR_TRY(_config.palette().resolve(_config.backgroundCode()));
    canvas::Canvas grid = PLR_TRY(canvas::Canvas::create(
        _config.width(), _config.height(), background, _config.palette()));

    diff::RecordDecoder decoder{source, _config.width(), _config.height(),
                                _config.palette(), _config.chunkRecords()};
    CutSchedule schedule{request};
    ReplaySummary summary;
    Emitter emitter{grid, _config, sink, summary};

    // Highest timestamp seen; equals the last event's on an ordered stream.
    core::Timestamp horizon = 0;

    for (;;)
    {
        const std::optional<diff::PlacementEvent> event = PLR_TRY(decoder.next());
        if (!event)
            break;

        if (summary.lastTimestamp && event->timestamp < *summary.lastTimestamp)
        {
            if (summary.regressionCount == 0)
            {
                core::Log::warn("replay", std::format(
                    "timestamp went back from {} to {} at byte {}; applying in arrival order",
                    *summary.lastTimestamp, event->timestamp, decoder.lastRecordOffset()));
            }
            ++summary.regressionCount;
        }

        while (const auto due = schedule.popDueBefore(event->timestamp))
            PLR_TRY_VOID(emitter.emit(*due));

        if (auto applied = grid.apply(*event); !applied)
        {
            core::Error err = std::move(applied.error());
            err.atOffset(decoder.lastRecordOffset());
            return std::unexpected(std::move(err));
        }

        if (!summary.firstTimestamp)
            summary.firstTimestamp = event->timestamp;
        summary.lastTimestamp = event->timestamp;
        horizon = std::max(horizon, event->timestamp);
        ++summary.eventCount;
    }

    summary.trailingBytes = decoder.trailingBytes();

    if (summary.empty())
    {
        core::Log::warn("replay", std::format("no event decoded from {}", source.describe()));
        while (const auto target = schedule.popWithoutEvents())
            PLR_TRY_VOID(emitter.emit(*target));
    }
    else
    {
        while (const auto due = schedule.popDueAtEnd(horizon))
            PLR_TRY_VOID(emitter.emit(*due));
    }

    const auto unreached = schedule.remaining();
    summary.unreachedTargets.assign(unreached.begin(), unreached.end());
    for (const auto target : summary.unreachedTargets)
        core::Log::warn("replay", std::format("Timestamp not found: {}", target));

    PLR_TRY_VOID(sink.finish());

    core::Log::info("replay", std::format(
        "{} events, {} snapshots ({} skipped) from {}",
        summary.eventCount, summary.snapshotCount, summary.skippedCount, source.describe()));
    return summary;
}

core::Expected<std::vector<canvas::Snapshot>> ReplayDriver::collect(stream::IByteSource& source,
                                                                    const CutRequest& request) const
{
    CollectingSink sink;
    PLR_TRY_VOID(run(source, request, sink));
    return sink.release();
}

} // namespace plr::replay
