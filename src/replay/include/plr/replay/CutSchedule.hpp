/**
 * @file CutSchedule.hpp
 * @brief Ascending cut-point sequence consumed alongside the event stream.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef PLR_REPLAY_CUTSCHEDULE_HPP
    #define PLR_REPLAY_CUTSCHEDULE_HPP

#include <plr/replay/CutRequest.hpp>
#include <plr/core/Types.hpp>

#include <optional>
#include <span>
#include <vector>

namespace plr::replay {

/**
 * @class CutSchedule
 * @brief Pointer into the target list of one run.
 *
 * Interval targets depend on the first event and the stream length is
 * unknown up front, so they are generated lazily.  The driver asks for
 * the targets that became due before each event, then for the targets
 * left once the stream ended.
 */
class CutSchedule
{
public:
    explicit CutSchedule(const CutRequest& request);

    /**
     * @brief Next target strictly earlier than @p eventTimestamp, consumed.
     *
     * Call repeatedly before applying the event until it returns nullopt.
     * The first call of an interval schedule anchors it on the event.
     */
    [[nodiscard]] std::optional<core::Timestamp> popDueBefore(core::Timestamp eventTimestamp);

    /**
     * @brief Next target at or before @p lastTimestamp once the stream ended, consumed.
     */
    [[nodiscard]] std::optional<core::Timestamp> popDueAtEnd(core::Timestamp lastTimestamp);

    /**
     * @brief Next explicit target regardless of any event, consumed.
     *
     * Used when the stream held no event at all; interval and latest
     * schedules have no anchor then and return nullopt.
     */
    [[nodiscard]] std::optional<core::Timestamp> popWithoutEvents();

    /** @brief Explicit targets never consumed. */
    [[nodiscard]] std::span<const core::Timestamp> remaining() const noexcept;

private:
    void stepInterval(core::Timestamp eventTimestamp) noexcept;

    CutRequest::Mode             _mode;
    core::u64                    _interval;
    std::vector<core::Timestamp> _targets;
    core::usize                  _next{0};
    std::optional<core::Timestamp> _cursor;
    bool                         _anchored{false};
    bool                         _latestDone{false};
};

} // namespace plr::replay

#endif // PLR_REPLAY_CUTSCHEDULE_HPP
