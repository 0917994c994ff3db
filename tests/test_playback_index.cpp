// gcview - Playback Index Tests

#include <gtest/gtest.h>

#include "core/gcode/gcode_parser.h"
#include "core/gcode/playback_index.h"
#include "core/gcode/time_estimator.h"

#include <cmath>
#include <limits>

using namespace gv;
using namespace gv::gcode;

namespace {

Segment makeSegment(SegmentType type, const Vec3& start, const Vec3& end) {
    Segment s;
    s.type = type;
    s.start = start;
    s.end = end;
    s.feedRate = type == SegmentType::Cut ? 600.0f : 0.0f;
    return s;
}

// cut 10 mm, rapid 10 mm, cut 10 mm
std::vector<Segment> cutRapidCut() {
    return {
        makeSegment(SegmentType::Cut, {0, 0, 0}, {10, 0, 0}),
        makeSegment(SegmentType::Rapid, {10, 0, 0}, {10, 10, 0}),
        makeSegment(SegmentType::Cut, {10, 10, 0}, {20, 10, 0}),
    };
}

std::vector<Segment> rapidsOnly(int count) {
    std::vector<Segment> segs;
    for (int i = 0; i < count; ++i) {
        segs.push_back(makeSegment(SegmentType::Rapid, {static_cast<f32>(i), 0, 0},
                                   {static_cast<f32>(i + 1), 0, 0}));
    }
    return segs;
}

} // namespace

// --- Cumulative table ---

TEST(PlaybackIndex, CumulativeDistancesSkipRapids) {
    PlaybackIndex index(cutRapidCut(), 5.0);

    const auto& cumulative = index.cumulativeDistances();
    ASSERT_EQ(cumulative.size(), 3u);
    EXPECT_DOUBLE_EQ(cumulative[0], 10.0);
    EXPECT_DOUBLE_EQ(cumulative[1], 10.0);
    EXPECT_DOUBLE_EQ(cumulative[2], 20.0);
    EXPECT_DOUBLE_EQ(index.totalDistance(), 20.0);
}

TEST(PlaybackIndex, CumulativeNonDecreasing) {
    Parser parser;
    auto program = parser.parse("G0 Z5\nG1 Z-1 F100\nG2 X10 I5\nG0 Z5\nG0 X0\nG1 Z-1\nG1 Y5\n");
    PlaybackIndex index(program.segments, 0.0);

    const auto& cumulative = index.cumulativeDistances();
    ASSERT_EQ(cumulative.size(), program.segments.size());
    for (size_t i = 1; i < cumulative.size(); ++i) {
        EXPECT_GE(cumulative[i], cumulative[i - 1]);
    }
}

// --- Distance lookups ---

TEST(PlaybackIndex, LocateStart) {
    PlaybackIndex index(cutRapidCut(), 0.0);
    EXPECT_EQ(index.locate(0.0), (SeekResult{0, 0.0, false}));
}

TEST(PlaybackIndex, LocateStartOnRapid) {
    std::vector<Segment> segs = {
        makeSegment(SegmentType::Rapid, {0, 0, 0}, {5, 0, 0}),
        makeSegment(SegmentType::Cut, {5, 0, 0}, {15, 0, 0}),
    };
    PlaybackIndex index(segs, 0.0);
    EXPECT_EQ(index.locate(0.0), (SeekResult{0, 1.0, false}));
}

TEST(PlaybackIndex, LocateInsideSegments) {
    PlaybackIndex index(cutRapidCut(), 0.0);

    auto first = index.locate(2.5);
    EXPECT_EQ(first.index, 0u);
    EXPECT_DOUBLE_EQ(first.progress, 0.25);

    auto boundary = index.locate(10.0);
    EXPECT_EQ(boundary.index, 0u);
    EXPECT_DOUBLE_EQ(boundary.progress, 1.0);

    // The rapid is skipped: distance past it lands on the second cut
    auto last = index.locate(17.5);
    EXPECT_EQ(last.index, 2u);
    EXPECT_DOUBLE_EQ(last.progress, 0.75);
    EXPECT_FALSE(last.finished);
}

TEST(PlaybackIndex, LocateEnd) {
    PlaybackIndex index(cutRapidCut(), 0.0);
    EXPECT_EQ(index.locate(20.0), (SeekResult{2, 1.0, true}));
    EXPECT_EQ(index.locate(500.0), (SeekResult{2, 1.0, true}));
}

TEST(PlaybackIndex, LocateNegativeClamped) {
    PlaybackIndex index(cutRapidCut(), 0.0);
    EXPECT_EQ(index.locate(-3.0), (SeekResult{0, 0.0, false}));
}

// --- Time and rate lookups ---

TEST(PlaybackIndex, LocateByTime) {
    PlaybackIndex index(rapidsOnly(4), 10.0);
    EXPECT_DOUBLE_EQ(index.totalDistance(), 0.0);

    EXPECT_EQ(index.locateByTime(0.0), (SeekResult{0, 1.0, false}));
    EXPECT_EQ(index.locateByTime(5.0), (SeekResult{2, 1.0, false}));
    EXPECT_EQ(index.locateByTime(10.0), (SeekResult{3, 1.0, true}));
}

TEST(PlaybackIndex, LocateByRate) {
    PlaybackIndex index(rapidsOnly(20), 0.0);
    // 100 segments per second at 1x
    EXPECT_EQ(index.locateByRate(0.0625, 1.0).index, 6u);
    EXPECT_EQ(index.locateByRate(0.0625, 2.0).index, 12u);
    EXPECT_EQ(index.locateByRate(1.0, 1.0), (SeekResult{19, 1.0, true}));
}

// --- seek ---

TEST(PlaybackIndex, SeekByDistance) {
    PlaybackIndex index(cutRapidCut(), 100.0);

    // 100 mm/s visual speed
    auto a = index.seek(0.0625, 1.0);
    EXPECT_EQ(a.index, 0u);
    EXPECT_DOUBLE_EQ(a.progress, 0.625);

    auto b = index.seek(0.0625, 2.0);
    EXPECT_EQ(b.index, 2u);
    EXPECT_DOUBLE_EQ(b.progress, 0.25);

    EXPECT_TRUE(index.seek(1.0, 1.0).finished);
}

TEST(PlaybackIndex, SeekByTimeForRapidOnlyPrograms) {
    PlaybackIndex index(rapidsOnly(4), 10.0);
    EXPECT_EQ(index.seek(2.5, 2.0), (SeekResult{2, 1.0, false}));
}

TEST(PlaybackIndex, SeekByRateWithoutTiming) {
    PlaybackIndex index(rapidsOnly(20), 0.0);
    EXPECT_EQ(index.seek(0.0625, 1.0), (SeekResult{6, 1.0, false}));
}

TEST(PlaybackIndex, SeekClampsSpeed) {
    PlaybackIndex index(rapidsOnly(2000), 0.0);
    // 50x is held to 10x
    EXPECT_EQ(index.seek(1.0, 50.0).index, 1000u);
}

TEST(PlaybackIndex, EmptyIndex) {
    PlaybackIndex index;
    EXPECT_EQ(index.locate(0.0), (SeekResult{0, 1.0, true}));
    EXPECT_EQ(index.seek(1.0, 1.0), (SeekResult{0, 1.0, true}));
}

TEST(PlaybackIndex, BuildFromEstimate) {
    Parser parser;
    auto program = parser.parse("G0 X5\nG1 F600 X15\nG0 Z5\n");
    TimeEstimator estimator;
    auto estimate = estimator.estimate(program.segments);

    PlaybackIndex index(program.segments, estimate.totalSeconds);
    EXPECT_DOUBLE_EQ(index.totalDistance(), 10.0);
    EXPECT_DOUBLE_EQ(index.totalEstimatedTime(), estimate.totalSeconds);
    EXPECT_EQ(index.locate(5.0).index, 1u);
}

TEST(PlaybackIndex, NonFiniteSegmentAddsNoDistance) {
    const f32 inf = std::numeric_limits<f32>::infinity();
    auto segs = cutRapidCut();
    segs.insert(segs.begin() + 1, makeSegment(SegmentType::Cut, {10, 0, 0}, {inf, 0, 0}));

    PlaybackIndex index(segs, std::numeric_limits<f64>::quiet_NaN());
    EXPECT_DOUBLE_EQ(index.totalDistance(), 20.0);
    EXPECT_DOUBLE_EQ(index.totalEstimatedTime(), 0.0);
    EXPECT_EQ(index.locate(15.0).index, 3u);
}

// --- Speed helpers ---

TEST(PlaybackIndex, ClampSpeed) {
    EXPECT_DOUBLE_EQ(PlaybackIndex::clampSpeed(0.01), 0.1);
    EXPECT_DOUBLE_EQ(PlaybackIndex::clampSpeed(3.0), 3.0);
    EXPECT_DOUBLE_EQ(PlaybackIndex::clampSpeed(20.0), 10.0);
}

TEST(PlaybackIndex, SliderToSpeed) {
    EXPECT_DOUBLE_EQ(PlaybackIndex::sliderToSpeed(0.0), 1.0);
    EXPECT_DOUBLE_EQ(PlaybackIndex::sliderToSpeed(10.0), 10.0);
    EXPECT_DOUBLE_EQ(PlaybackIndex::sliderToSpeed(5.0), 5.5);
    EXPECT_DOUBLE_EQ(PlaybackIndex::sliderToSpeed(-10.0), 0.1);
    EXPECT_DOUBLE_EQ(PlaybackIndex::sliderToSpeed(-5.0), 0.55);
}
