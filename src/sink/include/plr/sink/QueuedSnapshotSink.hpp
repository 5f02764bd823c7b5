/**
 * @file QueuedSnapshotSink.hpp
 * @brief Moves snapshot persistence to one background worker.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_SINK_QUEUEDSNAPSHOTSINK_HPP
    #define PLR_SINK_QUEUEDSNAPSHOTSINK_HPP

#include <plr/replay/ISnapshotSink.hpp>
#include <plr/core/Constants.hpp>
#include <plr/core/NonCopyable.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <thread>

namespace plr::sink {

/**
 * @class QueuedSnapshotSink
 * @brief Decouples the replay loop from a slow sink.
 *
 * A single worker forwards snapshots to @p inner in the order they were
 * consumed.  At most @p depth snapshots wait in the queue; consume()
 * blocks beyond that so memory stays bounded.  The first failure of the
 * inner sink is sticky: later snapshots are dropped and the error is
 * returned by the next consume() or by finish().
 *
 * The destructor still hands every queued snapshot to @p inner, so a run
 * that fails keeps the snapshots emitted before the failure.  Only
 * finish() calls inner.finish().
 */
class QueuedSnapshotSink final : public replay::ISnapshotSink,
                                 public core::NonCopyable<QueuedSnapshotSink>
{
public:
    explicit QueuedSnapshotSink(replay::ISnapshotSink& inner,
                                core::usize depth = core::kDefaultSinkQueueDepth);
    ~QueuedSnapshotSink() override;

    [[nodiscard]] core::ExpectedVoid consume(canvas::Snapshot snapshot) override;

    /** @brief Drain the queue, join the worker, then finish the inner sink. */
    [[nodiscard]] core::ExpectedVoid finish() override;

private:
    void workerLoop();
    void stop() noexcept;

    replay::ISnapshotSink&       _inner;
    core::usize                  _depth;

    std::mutex                   _mutex;
    std::condition_variable      _notEmpty;
    std::condition_variable      _notFull;
    std::deque<canvas::Snapshot> _queue;
    std::optional<core::Error>   _failure;
    bool                         _closing{false};

    std::thread                  _worker;
};

} // namespace plr::sink

#endif // PLR_SINK_QUEUEDSNAPSHOTSINK_HPP
