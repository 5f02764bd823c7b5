/**
 * @file CutSchedule.cpp
 * @brief CutSchedule implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/replay/CutSchedule.hpp>
#include <plr/core/Assert.hpp>

namespace plr::replay {

CutSchedule::CutSchedule(const CutRequest& request)
    : _mode{request.mode()}
    , _interval{request.intervalSeconds()}
    , _targets{request.explicitTargets()}
{
}

std::optional<core::Timestamp> CutSchedule::popDueBefore(core::Timestamp eventTimestamp)
{
    switch (_mode)
    {
        case CutRequest::Mode::kExplicit:
            if (_next < _targets.size() && _targets[_next] < eventTimestamp)
                return _targets[_next++];
            return std::nullopt;

        case CutRequest::Mode::kInterval:
            if (!_anchored)
            {
                _anchored = true;
                _cursor = eventTimestamp;
                return std::nullopt;
            }
            if (_cursor && *_cursor < eventTimestamp)
            {
                const core::Timestamp due = *_cursor;
                stepInterval(eventTimestamp);
                return due;
            }
            return std::nullopt;

        case CutRequest::Mode::kLatest:
            return std::nullopt;
    }
    PLR_UNREACHABLE();
}

std::optional<core::Timestamp> CutSchedule::popDueAtEnd(core::Timestamp lastTimestamp)
{
    switch (_mode)
    {
        case CutRequest::Mode::kExplicit:
            if (_next < _targets.size() && _targets[_next] <= lastTimestamp)
                return _targets[_next++];
            return std::nullopt;

        case CutRequest::Mode::kInterval:
            if (_cursor && *_cursor <= lastTimestamp)
            {
                const core::Timestamp due = *_cursor;
                if (_interval == 0)
                    _cursor.reset();
                else
                    stepInterval(lastTimestamp);
                return due;
            }
            return std::nullopt;

        case CutRequest::Mode::kLatest:
            if (_latestDone)
                return std::nullopt;
            _latestDone = true;
            return lastTimestamp;
    }
    PLR_UNREACHABLE();
}

std::optional<core::Timestamp> CutSchedule::popWithoutEvents()
{
    if (_mode == CutRequest::Mode::kExplicit && _next < _targets.size())
        return _targets[_next++];
    return std::nullopt;
}

std::span<const core::Timestamp> CutSchedule::remaining() const noexcept
{
    return std::span<const core::Timestamp>{_targets}.subspan(_next);
}

void CutSchedule::stepInterval(core::Timestamp eventTimestamp) noexcept
{
    PLR_ASSERT(_cursor.has_value());

    // Interval 0: the next target is the timestamp of the event that
    // made the current one due.
    if (_interval == 0)
    {
        _cursor = eventTimestamp;
        return;
    }

    // A target past the 64-bit range can never be reached.
    if (*_cursor > kInfiniteInterval - _interval)
        _cursor.reset();
    else
        *_cursor += _interval;
}

} // namespace plr::replay
