/**
 * @file TestReplayDriver.cpp
 * @brief Unit tests for replay::ReplayDriver.
 */

#include <catch2/catch_test_macros.hpp>

#include "plr/replay/CollectingSink.hpp"
#include "plr/replay/ReplayDriver.hpp"
#include "plr/canvas/Canvas.hpp"
#include "plr/stream/MemoryByteSource.hpp"
#include "plr/testing/CapturingLogger.hpp"
#include "plr/testing/DiffBuilder.hpp"

#include <array>
#include <vector>

namespace plr::replay {

namespace {

ReplayConfig smallConfig(core::Coord w = 2, core::Coord h = 2)
{
    return ReplayConfig::Builder{}.width(w).height(h).build();
}

core::Expected<std::vector<canvas::Snapshot>> replayBytes(const ReplayConfig &config,
                                                           std::vector<core::byte> bytes,
                                                           const CutRequest &request)
{
    stream::MemoryByteSource source{std::move(bytes)};
    PLR_TRY_VOID(source.open());
    return ReplayDriver{config}.collect(source, request);
}

/// Rows of color codes, top to bottom.
template <std::size_t W, std::size_t H>
bool showsCodes(const canvas::Snapshot &shot, const std::array<std::array<core::ColorCode, W>, H> &codes)
{
    const auto &p = palette::archivePalette();
    for (core::Coord y = 0; y < H; ++y)
        for (core::Coord x = 0; x < W; ++x)
            if (shot.at(x, y) != *p.resolve(codes[y][x]))
                return false;
    return true;
}

bool allBackground(const canvas::Snapshot &shot)
{
    const auto white = *palette::archivePalette().resolve(0);
    for (const auto px : shot.pixels())
        if (px != white)
            return false;
    return true;
}

/// Counts finish() calls and fails after a set number of snapshots.
class ProbeSink final : public ISnapshotSink
{
public:
    explicit ProbeSink(core::u64 failAfter = ~0ULL) : _failAfter{failAfter} {}

    core::ExpectedVoid consume(canvas::Snapshot snapshot) override
    {
        if (labels.size() == _failAfter)
            return core::makeError(core::ErrorCode::kSinkFailed, "disk full");
        labels.push_back(snapshot.label());
        return {};
    }

    core::ExpectedVoid finish() override
    {
        ++finishCalls;
        return {};
    }

    std::vector<canvas::SnapshotLabel> labels;
    int finishCalls{0};

private:
    core::u64 _failAfter;
};

testing::DiffBuilder threeEvents()
{
    testing::DiffBuilder builder;
    builder.place(100, 0, 0, 1).place(200, 0, 0, 2).place(300, 1, 1, 1);
    return builder;
}

} // namespace

TEST_CASE("Explicit cut points reflect events up to each target", "[replay][driver]")
{
    auto shots = replayBytes(smallConfig(), threeEvents().take(), CutRequest::timestamps({150, 250}));

    REQUIRE(shots.has_value());
    REQUIRE(shots->size() == 2);
    REQUIRE((*shots)[0].label() == canvas::SnapshotLabel{150, 0});
    REQUIRE((*shots)[1].label() == canvas::SnapshotLabel{250, 1});

    using Grid = std::array<std::array<core::ColorCode, 2>, 2>;
    REQUIRE(showsCodes((*shots)[0], Grid{{{1, 0}, {0, 0}}}));
    REQUIRE(showsCodes((*shots)[1], Grid{{{2, 0}, {0, 0}}}));
}

TEST_CASE("Replay is deterministic", "[replay][driver]")
{
    testing::DiffBuilder builder;
    for (core::u32 i = 0; i < 200; ++i)
        builder.place(1000 + i / 3, (i * 7) % 16, (i * 11) % 16, i % 16);

    const auto config = smallConfig(16, 16);
    auto first  = replayBytes(config, builder.bytes(), CutRequest::interval(5));
    auto second = replayBytes(config, builder.bytes(), CutRequest::interval(5));

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->size() == second->size());
    for (std::size_t i = 0; i < first->size(); ++i)
    {
        REQUIRE((*first)[i].label() == (*second)[i].label());
        REQUIRE((*first)[i].digest() == (*second)[i].digest());
        REQUIRE((*first)[i].samePixels((*second)[i]));
    }
}

TEST_CASE("Each snapshot equals the canvas after all events up to its target", "[replay][driver]")
{
    struct Placement { core::u32 t, x, y, c; };
    const std::vector<Placement> events{
        {10, 0, 0, 1}, {10, 1, 0, 2}, {12, 0, 0, 3}, {15, 2, 2, 4},
        {15, 0, 0, 5}, {21, 1, 1, 6}, {30, 2, 0, 7}, {30, 2, 0, 8},
    };

    testing::DiffBuilder builder;
    for (const auto &e : events)
        builder.place(e.t, e.x, e.y, e.c);

    auto shots = replayBytes(smallConfig(3, 3), builder.take(), CutRequest::timestamps({5, 10, 11, 15, 20, 21, 30}));
    REQUIRE(shots.has_value());
    REQUIRE(shots->size() == 7);

    for (const auto &shot : *shots)
    {
        auto expected = canvas::Canvas::create(3, 3, *palette::archivePalette().resolve(0),
                                               palette::archivePalette());
        REQUIRE(expected.has_value());
        for (const auto &e : events)
            if (e.t <= shot.timestamp())
                REQUIRE(expected->apply({e.t, e.x, e.y, e.c}).has_value());

        REQUIRE(shot.samePixels(expected->snapshot({})));
    }
}

TEST_CASE("Latest equals an interval of infinity", "[replay][driver]")
{
    const auto config = smallConfig();

    auto latest   = replayBytes(config, threeEvents().take(), CutRequest::latest());
    auto infinite = replayBytes(config, threeEvents().take(), CutRequest::interval(kInfiniteInterval));

    REQUIRE(latest.has_value());
    REQUIRE(infinite.has_value());
    REQUIRE(latest->size() == 1);
    REQUIRE(infinite->size() == 1);
    REQUIRE((*latest)[0].timestamp() == 300);
    REQUIRE((*latest)[0].samePixels((*infinite)[0]));

    using Grid = std::array<std::array<core::ColorCode, 2>, 2>;
    REQUIRE(showsCodes((*latest)[0], Grid{{{2, 0}, {0, 1}}}));
}

TEST_CASE("Interval zero emits once per distinct timestamp", "[replay][driver]")
{
    auto bytes = testing::DiffBuilder{}
        .place(10, 0, 0, 1)
        .place(10, 1, 0, 2)
        .place(20, 0, 1, 3)
        .place(30, 1, 1, 4)
        .take();

    auto shots = replayBytes(smallConfig(), std::move(bytes), CutRequest::interval(0));

    REQUIRE(shots.has_value());
    REQUIRE(shots->size() == 3);
    REQUIRE((*shots)[0].timestamp() == 10);
    REQUIRE((*shots)[1].timestamp() == 20);
    REQUIRE((*shots)[2].timestamp() == 30);

    using Grid = std::array<std::array<core::ColorCode, 2>, 2>;
    REQUIRE(showsCodes((*shots)[0], Grid{{{1, 2}, {0, 0}}}));
}

TEST_CASE("Interval targets inside a gap repeat the same canvas", "[replay][driver]")
{
    auto bytes = testing::DiffBuilder{}
        .place(100, 0, 0, 1)
        .place(105, 1, 0, 2)
        .place(130, 1, 1, 3)
        .take();

    auto shots = replayBytes(smallConfig(), std::move(bytes), CutRequest::interval(10));

    REQUIRE(shots.has_value());
    REQUIRE(shots->size() == 4);

    const std::array<core::Timestamp, 4> labels{100, 110, 120, 130};
    for (std::size_t i = 0; i < labels.size(); ++i)
    {
        REQUIRE((*shots)[i].label().timestamp == labels[i]);
        REQUIRE((*shots)[i].label().index == i);
    }

    REQUIRE((*shots)[1].samePixels((*shots)[2]));
    REQUIRE_FALSE((*shots)[0].samePixels((*shots)[1]));
    REQUIRE_FALSE((*shots)[2].samePixels((*shots)[3]));
}

TEST_CASE("Target before the first event is all background", "[replay][driver]")
{
    auto shots = replayBytes(smallConfig(), threeEvents().take(), CutRequest::timestamps({50, 100}));

    REQUIRE(shots.has_value());
    REQUIRE(shots->size() == 2);
    REQUIRE(allBackground((*shots)[0]));
    REQUIRE_FALSE(allBackground((*shots)[1]));
}

TEST_CASE("Events sharing a timestamp are all applied before the cut", "[replay][driver]")
{
    auto bytes = testing::DiffBuilder{}
        .place(100, 0, 0, 1)
        .place(100, 1, 0, 2)
        .place(100, 0, 0, 4)
        .place(101, 1, 1, 3)
        .take();

    auto shots = replayBytes(smallConfig(), std::move(bytes), CutRequest::timestamps({100}));

    REQUIRE(shots.has_value());
    REQUIRE(shots->size() == 1);

    using Grid = std::array<std::array<core::ColorCode, 2>, 2>;
    REQUIRE(showsCodes((*shots)[0], Grid{{{4, 2}, {0, 0}}}));
}

TEST_CASE("Skipped timestamps produce no snapshot", "[replay][driver]")
{
    auto bytes = testing::DiffBuilder{}
        .place(100, 0, 0, 1)
        .place(130, 1, 1, 3)
        .take();

    const auto config = ReplayConfig::Builder{}.width(2).height(2).skipTimestamp(110).build();
    stream::MemoryByteSource source{std::move(bytes)};
    REQUIRE(source.open().has_value());

    ProbeSink sink;
    auto summary = ReplayDriver{config}.run(source, CutRequest::interval(10), sink);

    REQUIRE(summary.has_value());
    REQUIRE(summary->skippedCount == 1);
    REQUIRE(summary->snapshotCount == 3);
    REQUIRE(sink.labels.size() == 3);
    REQUIRE(sink.labels[0] == canvas::SnapshotLabel{100, 0});
    REQUIRE(sink.labels[1] == canvas::SnapshotLabel{120, 1});
    REQUIRE(sink.labels[2] == canvas::SnapshotLabel{130, 2});
}

TEST_CASE("Targets past the last event are reported as unreached", "[replay][driver]")
{
    testing::CapturingLogger capture;
    stream::MemoryByteSource source{threeEvents().take()};
    REQUIRE(source.open().has_value());

    ProbeSink sink;
    auto summary = ReplayDriver{smallConfig()}.run(source, CutRequest::timestamps({150, 300, 400}), sink);

    REQUIRE(summary.has_value());
    REQUIRE(summary->snapshotCount == 2);
    REQUIRE(summary->eventCount == 3);
    REQUIRE(summary->firstTimestamp == 100u);
    REQUIRE(summary->lastTimestamp == 300u);
    REQUIRE(summary->unreachedTargets == std::vector<core::Timestamp>{400});
    REQUIRE(capture.contains(core::LogLevel::kWarn, "Timestamp not found: 400"));
    REQUIRE(sink.finishCalls == 1);
}

TEST_CASE("Empty stream yields background for explicit targets only", "[replay][driver]")
{
    testing::CapturingLogger capture;
    const auto config = smallConfig();

    auto explicitShots = replayBytes(config, {}, CutRequest::timestamps({5, 6}));
    REQUIRE(explicitShots.has_value());
    REQUIRE(explicitShots->size() == 2);
    REQUIRE(allBackground((*explicitShots)[0]));

    auto latestShots = replayBytes(config, {}, CutRequest::latest());
    REQUIRE(latestShots.has_value());
    REQUIRE(latestShots->empty());

    auto intervalShots = replayBytes(config, {}, CutRequest::interval(10));
    REQUIRE(intervalShots.has_value());
    REQUIRE(intervalShots->empty());

    stream::MemoryByteSource source{std::vector<core::byte>{}};
    REQUIRE(source.open().has_value());
    ProbeSink sink;
    auto summary = ReplayDriver{config}.run(source, CutRequest::latest(), sink);
    REQUIRE(summary.has_value());
    REQUIRE(summary->empty());
    REQUIRE(capture.contains(core::LogLevel::kWarn, "no event decoded"));
}

TEST_CASE("Trailing bytes do not change the snapshots", "[replay][driver]")
{
    auto clean     = replayBytes(smallConfig(), threeEvents().take(), CutRequest::interval(50));
    auto truncated = replayBytes(smallConfig(), threeEvents().raw({0xAA, 0xBB, 0xCC}).take(), CutRequest::interval(50));

    REQUIRE(clean.has_value());
    REQUIRE(truncated.has_value());
    REQUIRE(clean->size() == truncated->size());
    for (std::size_t i = 0; i < clean->size(); ++i)
        REQUIRE((*clean)[i].digest() == (*truncated)[i].digest());
}

TEST_CASE("Sink failure aborts the run", "[replay][driver]")
{
    stream::MemoryByteSource source{threeEvents().take()};
    REQUIRE(source.open().has_value());

    ProbeSink sink{1};
    auto summary = ReplayDriver{smallConfig()}.run(source, CutRequest::timestamps({150, 250}), sink);

    REQUIRE_FALSE(summary.has_value());
    REQUIRE(summary.error().code() == core::ErrorCode::kSinkFailed);
    REQUIRE(summary.error().message().find("250") != std::string::npos);
    REQUIRE(sink.labels.size() == 1);
    REQUIRE(sink.finishCalls == 0);
}

TEST_CASE("Malformed record stops the run at its offset", "[replay][driver]")
{
    auto bytes = threeEvents().take();
    testing::DiffBuilder bad;
    bad.place(300, 5, 0, 1);
    bytes.insert(bytes.begin() + 32, bad.bytes().begin(), bad.bytes().end());

    stream::MemoryByteSource source{std::move(bytes)};
    REQUIRE(source.open().has_value());

    ProbeSink sink;
    auto summary = ReplayDriver{smallConfig()}.run(source, CutRequest::timestamps({150, 250, 350}), sink);

    REQUIRE_FALSE(summary.has_value());
    REQUIRE(summary.error().code() == core::ErrorCode::kMalformedRecord);
    REQUIRE(summary.error().offset() == 32u);
    REQUIRE(sink.labels.size() == 1);
    REQUIRE(sink.labels[0].timestamp == 150);
    REQUIRE(sink.finishCalls == 0);
}

TEST_CASE("Timestamp regressions are applied in arrival order", "[replay][driver]")
{
    testing::CapturingLogger capture;
    auto bytes = testing::DiffBuilder{}
        .place(200, 0, 0, 1)
        .place(100, 0, 0, 2)
        .take();

    stream::MemoryByteSource source{std::move(bytes)};
    REQUIRE(source.open().has_value());

    CollectingSink sink;
    auto summary = ReplayDriver{smallConfig()}.run(source, CutRequest::latest(), sink);

    REQUIRE(summary.has_value());
    REQUIRE(summary->regressionCount == 1);
    REQUIRE(capture.contains(core::LogLevel::kWarn, "went back"));
    REQUIRE(sink.snapshots().size() == 1);
    REQUIRE(sink.snapshots()[0].timestamp() == 200);

    using Grid = std::array<std::array<core::ColorCode, 2>, 2>;
    REQUIRE(showsCodes(sink.snapshots()[0], Grid{{{2, 0}, {0, 0}}}));
}

TEST_CASE("Background code outside the palette is rejected", "[replay][driver]")
{
    const auto config = ReplayConfig::Builder{}.width(2).height(2).backgroundCode(42).build();
    auto shots = replayBytes(config, threeEvents().take(), CutRequest::latest());

    REQUIRE_FALSE(shots.has_value());
    REQUIRE(shots.error().code() == core::ErrorCode::kUnknownColorCode);
}

} // namespace plr::replay
