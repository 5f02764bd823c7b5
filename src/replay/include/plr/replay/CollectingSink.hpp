/**
 * @file CollectingSink.hpp
 * @brief Sink keeping every snapshot in memory.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_REPLAY_COLLECTINGSINK_HPP
    #define PLR_REPLAY_COLLECTINGSINK_HPP

#include <plr/replay/ISnapshotSink.hpp>

#include <vector>

namespace plr::replay {

class CollectingSink final : public ISnapshotSink
{
public:
    [[nodiscard]] core::ExpectedVoid consume(canvas::Snapshot snapshot) override
    {
        _snapshots.push_back(std::move(snapshot));
        return {};
    }

    [[nodiscard]] const std::vector<canvas::Snapshot>& snapshots() const noexcept { return _snapshots; }

    /** @brief Hand the collected snapshots over to the caller. */
    [[nodiscard]] std::vector<canvas::Snapshot> release() noexcept { return std::move(_snapshots); }

private:
    std::vector<canvas::Snapshot> _snapshots;
};

} // namespace plr::replay

#endif // PLR_REPLAY_COLLECTINGSINK_HPP
