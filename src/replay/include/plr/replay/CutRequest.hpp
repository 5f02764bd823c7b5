/**
 * @file CutRequest.hpp
 * @brief Which instants a replay run must materialize.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_REPLAY_CUTREQUEST_HPP
    #define PLR_REPLAY_CUTREQUEST_HPP

#include <plr/core/Types.hpp>

#include <limits>
#include <vector>

namespace plr::replay {

/** @brief Interval value standing for "no second target". */
inline constexpr core::u64 kInfiniteInterval = std::numeric_limits<core::u64>::max();

/**
 * @class CutRequest
 * @brief One of Latest, Interval(seconds) or ExplicitTimestamps(set).
 *
 * The three modes are mutually exclusive.  Explicit timestamps are
 * de-duplicated and sorted ascending on construction.  An infinite
 * interval only ever reaches its first target at the end of the stream,
 * so it is stored as Latest.
 */
class CutRequest
{
public:
    enum class Mode : core::u8
    {
        kLatest,
        kInterval,
        kExplicit
    };

    /** @brief A single snapshot at the timestamp of the final event. */
    [[nodiscard]] static CutRequest latest();

    /**
     * @brief Targets t0, t0 + seconds, t0 + 2 * seconds... up to the last event.
     *
     * t0 is the first event's timestamp.  Zero means one snapshot per
     * distinct event timestamp.
     */
    [[nodiscard]] static CutRequest interval(core::u64 seconds);

    /** @brief Caller-chosen instants. */
    [[nodiscard]] static CutRequest timestamps(std::vector<core::Timestamp> targets);

    [[nodiscard]] Mode mode() const noexcept { return _mode; }
    [[nodiscard]] core::u64 intervalSeconds() const noexcept { return _interval; }
    [[nodiscard]] const std::vector<core::Timestamp>& explicitTargets() const noexcept { return _targets; }

private:
    CutRequest(Mode mode, core::u64 interval, std::vector<core::Timestamp> targets);

    Mode                         _mode;
    core::u64                    _interval;
    std::vector<core::Timestamp> _targets;
};

} // namespace plr::replay

#endif // PLR_REPLAY_CUTREQUEST_HPP
