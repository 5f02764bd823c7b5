/**
 * @file ISnapshotSink.hpp
 * @brief Receiver of the snapshots emitted by a replay run.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_REPLAY_ISNAPSHOTSINK_HPP
    #define PLR_REPLAY_ISNAPSHOTSINK_HPP

#include <plr/canvas/Snapshot.hpp>
#include <plr/core/Expected.hpp>

namespace plr::replay {

/**
 * @brief Takes ownership of snapshots, in non-decreasing target order.
 *
 * A failing consume() aborts the run.  finish() is called once after the
 * last snapshot of a successful run; it is not called after a failure.
 */
class ISnapshotSink
{
public:
    virtual ~ISnapshotSink() = default;

    [[nodiscard]] virtual core::ExpectedVoid consume(canvas::Snapshot snapshot) = 0;

    [[nodiscard]] virtual core::ExpectedVoid finish() { return {}; }
};

} // namespace plr::replay

#endif // PLR_REPLAY_ISNAPSHOTSINK_HPP
