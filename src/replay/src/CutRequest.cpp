/**
 * @file CutRequest.cpp
 * @brief CutRequest implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */

#include <plr/replay/CutRequest.hpp>

#include <algorithm>

namespace plr::replay {

CutRequest::CutRequest(Mode mode, core::u64 interval, std::vector<core::Timestamp> targets)
    : _mode{mode}
    , _interval{interval}
    , _targets{std::move(targets)}
{
}

CutRequest CutRequest::latest()
{
    return CutRequest{Mode::kLatest, 0, {}};
}

CutRequest CutRequest::interval(core::u64 seconds)
{
    if (seconds == kInfiniteInterval)
        return latest();
    return CutRequest{Mode::kInterval, seconds, {}};
}

CutRequest CutRequest::timestamps(std::vector<core::Timestamp> targets)
{
    std::ranges::sort(targets);
    const auto dup = std::ranges::unique(targets);
    targets.erase(dup.begin(), dup.end());
    return CutRequest{Mode::kExplicit, 0, std::move(targets)};
}

} // namespace plr::replay
