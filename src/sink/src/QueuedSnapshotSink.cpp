/**
 * @file QueuedSnapshotSink.cpp
 * @brief QueuedSnapshotSink implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/sink/QueuedSnapshotSink.hpp>
#include <plr/core/Log.hpp>

#include <algorithm>
#include <format>

namespace plr::sink {

// -------------------------------------------------------------------------- //
//  Construction / Destruction                                                //
// -------------------------------------------------------------------------- //

QueuedSnapshotSink::QueuedSnapshotSink(replay::ISnapshotSink& inner, core::usize depth)
    : _inner{inner}
    , _depth{std::max<core::usize>(depth, 1)}
{
    _worker = std::thread{&QueuedSnapshotSink::workerLoop, this};
}

QueuedSnapshotSink::~QueuedSnapshotSink()
{
    stop();
}

// -------------------------------------------------------------------------- //
//  Sink                                                                      //
// -------------------------------------------------------------------------- //

core::ExpectedVoid QueuedSnapshotSink::consume(canvas::Snapshot snapshot)
{
    std::unique_lock<std::mutex> lock{_mutex};
    _notFull.wait(lock, [this] { return _failure || _queue.size() < _depth; });

    if (_failure)
        return std::unexpected(*_failure);
    if (_closing)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "queued sink already finished");
    }

    _queue.push_back(std::move(snapshot));
    lock.unlock();
    _notEmpty.notify_one();
    return {};
}

core::ExpectedVoid QueuedSnapshotSink::finish()
{
    stop();

    std::optional<core::Error> failure;
    {
        std::lock_guard<std::mutex> lock{_mutex};
        failure = _failure;
    }
    if (failure)
        return std::unexpected(std::move(*failure));
    return _inner.finish();
}

// -------------------------------------------------------------------------- //
//  Private                                                                   //
// -------------------------------------------------------------------------- //

void QueuedSnapshotSink::stop() noexcept
{
    {
        std::lock_guard<std::mutex> lock{_mutex};
        _closing = true;
    }
    _notEmpty.notify_all();
    _notFull.notify_all();

    if (_worker.joinable())
        _worker.join();
}

void QueuedSnapshotSink::workerLoop()
{
    for (;;)
    {
        std::optional<canvas::Snapshot> next;

        {
            std::unique_lock<std::mutex> lock{_mutex};
            _notEmpty.wait(lock, [this] { return _closing || !_queue.empty(); });

            if (_queue.empty())
                return;

            next.emplace(std::move(_queue.front()));
            _queue.pop_front();
        }
        _notFull.notify_one();

        auto stored = _inner.consume(std::move(*next));
        if (!stored)
        {
            core::Log::error("sink", stored.error().describe());

            std::lock_guard<std::mutex> lock{_mutex};
            _failure = std::move(stored.error());
            _queue.clear();
            _notFull.notify_all();
            return;
        }
    }
}

} // namespace plr::sink
