/**
 * @file TestCutSchedule.cpp
 * @brief Unit tests for replay::CutRequest and replay::CutSchedule.
 */

#include <catch2/catch_test_macros.hpp>

#include "plr/replay/CutSchedule.hpp"

namespace plr::replay {

TEST_CASE("Explicit targets are sorted and de-duplicated", "[replay][cut]")
{
    const auto request = CutRequest::timestamps({300, 100, 200, 100});

    REQUIRE(request.mode() == CutRequest::Mode::kExplicit);
    REQUIRE(request.explicitTargets() == std::vector<core::Timestamp>{100, 200, 300});
}

TEST_CASE("Infinite interval is the latest-only request", "[replay][cut]")
{
    REQUIRE(CutRequest::interval(kInfiniteInterval).mode() == CutRequest::Mode::kLatest);
    REQUIRE(CutRequest::interval(60).mode() == CutRequest::Mode::kInterval);
    REQUIRE(CutRequest::interval(60).intervalSeconds() == 60);
}

TEST_CASE("Explicit schedule releases targets strictly before an event", "[replay][cut]")
{
    CutSchedule schedule{CutRequest::timestamps({100, 150, 400})};

    REQUIRE_FALSE(schedule.popDueBefore(100).has_value());
    REQUIRE(schedule.popDueBefore(200) == 100u);
    REQUIRE(schedule.popDueBefore(200) == 150u);
    REQUIRE_FALSE(schedule.popDueBefore(200).has_value());

    REQUIRE_FALSE(schedule.popDueAtEnd(300).has_value());
    REQUIRE(schedule.remaining().size() == 1);
    REQUIRE(schedule.remaining()[0] == 400u);
}

TEST_CASE("Interval schedule anchors on the first event", "[replay][cut]")
{
    CutSchedule schedule{CutRequest::interval(10)};

    REQUIRE_FALSE(schedule.popDueBefore(100).has_value());
    REQUIRE(schedule.popDueBefore(125) == 100u);
    REQUIRE(schedule.popDueBefore(125) == 110u);
    REQUIRE(schedule.popDueBefore(125) == 120u);
    REQUIRE_FALSE(schedule.popDueBefore(125).has_value());

    REQUIRE_FALSE(schedule.popDueAtEnd(125).has_value());
    REQUIRE(schedule.remaining().empty());
}

TEST_CASE("Interval schedule flushes the boundary equal to the last event", "[replay][cut]")
{
    CutSchedule schedule{CutRequest::interval(10)};

    REQUIRE_FALSE(schedule.popDueBefore(100).has_value());
    REQUIRE(schedule.popDueBefore(120) == 100u);
    REQUIRE(schedule.popDueBefore(120) == 110u);
    REQUIRE(schedule.popDueAtEnd(120) == 120u);
    REQUIRE_FALSE(schedule.popDueAtEnd(120).has_value());
}

TEST_CASE("Interval schedule stops before overflowing", "[replay][cut]")
{
    CutSchedule schedule{CutRequest::interval(kInfiniteInterval - 1)};

    REQUIRE_FALSE(schedule.popDueBefore(5).has_value());
    REQUIRE(schedule.popDueBefore(6) == 5u);
    REQUIRE_FALSE(schedule.popDueBefore(kInfiniteInterval).has_value());
    REQUIRE_FALSE(schedule.popDueAtEnd(kInfiniteInterval).has_value());
}

TEST_CASE("Latest schedule emits once at the end", "[replay][cut]")
{
    CutSchedule schedule{CutRequest::latest()};

    REQUIRE_FALSE(schedule.popDueBefore(100).has_value());
    REQUIRE_FALSE(schedule.popDueBefore(200).has_value());
    REQUIRE(schedule.popDueAtEnd(200) == 200u);
    REQUIRE_FALSE(schedule.popDueAtEnd(200).has_value());
}

TEST_CASE("Only explicit targets survive an empty stream", "[replay][cut]")
{
    CutSchedule explicitSchedule{CutRequest::timestamps({7, 3})};
    REQUIRE(explicitSchedule.popWithoutEvents() == 3u);
    REQUIRE(explicitSchedule.popWithoutEvents() == 7u);
    REQUIRE_FALSE(explicitSchedule.popWithoutEvents().has_value());

    CutSchedule latest{CutRequest::latest()};
    REQUIRE_FALSE(latest.popWithoutEvents().has_value());

    CutSchedule interval{CutRequest::interval(5)};
    REQUIRE_FALSE(interval.popWithoutEvents().has_value());
}

} // namespace plr::replay
