/**
 * @file ReplayDriver.hpp
 * @brief Single-pass replay of a diff stream into snapshots.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_REPLAY_REPLAYDRIVER_HPP
    #define PLR_REPLAY_REPLAYDRIVER_HPP

#include <plr/replay/CutRequest.hpp>
#include <plr/replay/ISnapshotSink.hpp>
#include <plr/replay/ReplayConfig.hpp>
#include <plr/stream/IByteSource.hpp>
#include <plr/canvas/Snapshot.hpp>
#include <plr/core/Expected.hpp>

#include <optional>
#include <vector>

namespace plr::replay {

/** @brief What a successful run did. */
struct ReplaySummary
{
    core::u64                      eventCount{0};
    core::u64                      snapshotCount{0};
    core::u64                      skippedCount{0};
    core::u64                      regressionCount{0};
    core::usize                    trailingBytes{0};
    std::optional<core::Timestamp> firstTimestamp;
    std::optional<core::Timestamp> lastTimestamp;

    /** @brief Explicit targets later than every event, never emitted. */
    std::vector<core::Timestamp>   unreachedTargets;

    [[nodiscard]] bool empty() const noexcept { return eventCount == 0; }
};

/**
 * @class ReplayDriver
 * @brief Folds the event stream over a fresh canvas, emitting at cut points.
 *
 * The snapshot labelled T reflects every event with timestamp <= T and
 * none later: events sharing a timestamp are all applied before a cut at
 * that timestamp, and a cut is emitted as soon as an event past it
 * arrives.  Any decode, palette or sink failure aborts the run; snapshots
 * already handed to the sink stay there but the run must be treated as
 * failed.
 *
 * Each run() builds its own canvas, so one driver may serve several runs.
 */
class ReplayDriver
{
public:
    explicit ReplayDriver(ReplayConfig config);

    /**
     * @brief Replay @p source (already opened) into @p sink.
     * @return Run summary, or the first error met.
     */
    [[nodiscard]] core::Expected<ReplaySummary> run(stream::IByteSource& source,
                                                    const CutRequest& request,
                                                    ISnapshotSink& sink) const;

    /**
     * @brief Replay @p source and return the snapshots in emission order.
     */
    [[nodiscard]] core::Expected<std::vector<canvas::Snapshot>> collect(stream::IByteSource& source,
                                                                        const CutRequest& request) const;

    [[nodiscard]] const ReplayConfig& config() const noexcept { return _config; }

private:
    ReplayConfig _config;
};

} // namespace plr::replay

#endif // PLR_REPLAY_REPLAYDRIVER_HPP
