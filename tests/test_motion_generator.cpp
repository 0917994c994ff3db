// gcview - Motion Generator Tests

#include <gtest/gtest.h>

#include "core/gcode/motion_generator.h"

#include <cmath>

using namespace gv::gcode;

namespace {

constexpr float kPi = 3.14159265358979f;

// Distance of p from the circle (cu, cv, r) in the plane given by two axis getters
template <typename U, typename V>
float circleError(const gv::Vec3& p, U u, V v, float cu, float cv, float r) {
    return std::fabs(std::hypot(u(p) - cu, v(p) - cv) - r);
}

} // namespace

// --- Linear moves ---

TEST(MotionGenerator, LinearMoveEmitsSegment) {
    MotionGenerator gen;
    ModalState state;
    state.feedRate = 600.0f;

    EXPECT_TRUE(gen.linearMove(state, tokenize("X10"), SegmentType::Cut, 3));

    ASSERT_EQ(gen.segments().size(), 1u);
    const auto& seg = gen.segments()[0];
    EXPECT_TRUE(seg.isCut());
    EXPECT_EQ(seg.start, gv::Vec3(0, 0, 0));
    EXPECT_EQ(seg.end, gv::Vec3(10, 0, 0));
    EXPECT_FLOAT_EQ(seg.feedRate, 600.0f);
    EXPECT_EQ(seg.tool, 1);
    EXPECT_EQ(seg.lineNumber, 3);
    EXPECT_EQ(state.position, gv::Vec3(10, 0, 0));
}

TEST(MotionGenerator, ZeroDisplacementSkipped) {
    MotionGenerator gen;
    ModalState state;
    EXPECT_FALSE(gen.linearMove(state, tokenize("X0 Y0 Z0"), SegmentType::Cut, 1));
    EXPECT_TRUE(gen.segments().empty());
    EXPECT_FALSE(gen.bounds().isValid());
}

TEST(MotionGenerator, RelativeMoves) {
    MotionGenerator gen;
    ModalState state;
    state.positioning = PositioningMode::Relative;

    gen.linearMove(state, tokenize("X5 Y1"), SegmentType::Rapid, 1);
    gen.linearMove(state, tokenize("X5"), SegmentType::Rapid, 2);

    ASSERT_EQ(gen.segments().size(), 2u);
    EXPECT_EQ(gen.segments()[1].start, gv::Vec3(5, 1, 0));
    EXPECT_EQ(state.position, gv::Vec3(10, 1, 0));
}

TEST(MotionGenerator, ToolChangeConsumedOnce) {
    MotionGenerator gen;
    ModalState state;
    state.pendingToolChange = ToolChange::Automatic;

    gen.linearMove(state, tokenize("X1"), SegmentType::Cut, 1);
    gen.linearMove(state, tokenize("X2"), SegmentType::Cut, 2);

    ASSERT_EQ(gen.segments().size(), 2u);
    EXPECT_EQ(gen.segments()[0].toolChange, ToolChange::Automatic);
    EXPECT_EQ(gen.segments()[1].toolChange, ToolChange::None);
    EXPECT_EQ(state.pendingToolChange, ToolChange::None);
}

TEST(MotionGenerator, BoundsFoldEndpoints) {
    MotionGenerator gen;
    ModalState state;
    gen.linearMove(state, tokenize("X-5 Y2 Z3"), SegmentType::Rapid, 1);
    gen.linearMove(state, tokenize("X10 Y-1 Z1"), SegmentType::Cut, 2);

    ASSERT_TRUE(gen.bounds().isValid());
    EXPECT_EQ(gen.bounds().min, gv::Vec3(-5, -1, 1));
    EXPECT_EQ(gen.bounds().max, gv::Vec3(10, 2, 3));
}

// --- Arcs ---

TEST(MotionGenerator, ArcSegmentCountClamped) {
    EXPECT_EQ(MotionGenerator::arcSegmentCount(0.01, 0.1), MotionGenerator::kMinArcSegments);
    EXPECT_EQ(MotionGenerator::arcSegmentCount(1000.0, 2.0 * kPi),
              MotionGenerator::kMaxArcSegments);
    // sqrt(4) * pi * 4 = 25.13
    EXPECT_EQ(MotionGenerator::arcSegmentCount(4.0, kPi), 25);
    EXPECT_EQ(MotionGenerator::arcSegmentCount(4.0, -kPi), 25);
}

TEST(MotionGenerator, ClockwiseHalfCircle) {
    MotionGenerator gen;
    ModalState state;
    state.feedRate = 300.0f;

    ASSERT_TRUE(gen.arcMove(state, tokenize("X0 Y10 I0 J5"), true, 1));

    const auto& segs = gen.segments();
    ASSERT_GE(segs.size(), 8u);
    ASSERT_LE(segs.size(), 64u);

    auto getX = [](const gv::Vec3& p) { return p.x; };
    auto getY = [](const gv::Vec3& p) { return p.y; };
    for (const auto& seg : segs) {
        EXPECT_TRUE(seg.isCut());
        EXPECT_LE(circleError(seg.end, getX, getY, 0.0f, 5.0f, 5.0f), 5e-3f);
        EXPECT_FLOAT_EQ(seg.end.z, 0.0f);
        // Clockwise from the bottom passes through negative X
        EXPECT_LE(seg.end.x, 1e-4f);
    }

    // Segments chain
    for (size_t i = 1; i < segs.size(); ++i) {
        EXPECT_EQ(segs[i].start, segs[i - 1].end);
    }

    EXPECT_EQ(state.position, gv::Vec3(0, 10, 0));
    EXPECT_NEAR(gen.bounds().min.x, -5.0f, 0.05f);
}

TEST(MotionGenerator, CounterClockwiseHalfCircle) {
    MotionGenerator gen;
    ModalState state;

    ASSERT_TRUE(gen.arcMove(state, tokenize("X0 Y10 J5"), false, 1));
    for (const auto& seg : gen.segments()) {
        EXPECT_GE(seg.end.x, -1e-4f);
    }
    EXPECT_NEAR(gen.bounds().max.x, 5.0f, 0.05f);
}

TEST(MotionGenerator, FullCircleWhenEndEqualsStart) {
    MotionGenerator gen;
    ModalState state;

    ASSERT_TRUE(gen.arcMove(state, tokenize("I5"), false, 1));
    ASSERT_FALSE(gen.segments().empty());
    EXPECT_NEAR(gen.bounds().max.x, 10.0f, 0.05f);
    EXPECT_NEAR(gen.bounds().min.y, -5.0f, 0.1f);
    EXPECT_NEAR(gen.bounds().max.y, 5.0f, 0.1f);
    EXPECT_EQ(state.position, gv::Vec3(0, 0, 0));
}

TEST(MotionGenerator, HelicalArcInterpolatesZ) {
    MotionGenerator gen;
    ModalState state;

    ASSERT_TRUE(gen.arcMove(state, tokenize("X0 Y10 Z-2 I0 J5"), true, 1));
    const auto& segs = gen.segments();
    EXPECT_FLOAT_EQ(segs.back().end.z, -2.0f);
    for (size_t i = 1; i < segs.size(); ++i) {
        EXPECT_LT(segs[i].end.z, segs[i - 1].end.z);
    }
}

TEST(MotionGenerator, ZXPlaneUsesKAndI) {
    MotionGenerator gen;
    ModalState state;
    state.plane = Plane::ZX;

    ASSERT_TRUE(gen.arcMove(state, tokenize("X0 Z10 K5"), false, 1));

    auto getZ = [](const gv::Vec3& p) { return p.z; };
    auto getX = [](const gv::Vec3& p) { return p.x; };
    for (const auto& seg : gen.segments()) {
        EXPECT_LE(circleError(seg.end, getZ, getX, 5.0f, 0.0f, 5.0f), 5e-3f);
        EXPECT_FLOAT_EQ(seg.end.y, 0.0f);
    }
    EXPECT_EQ(state.position, gv::Vec3(0, 0, 10));
}

TEST(MotionGenerator, YZPlaneUsesJAndK) {
    MotionGenerator gen;
    ModalState state;
    state.plane = Plane::YZ;

    ASSERT_TRUE(gen.arcMove(state, tokenize("Y10 Z0 J5"), true, 1));

    auto getY = [](const gv::Vec3& p) { return p.y; };
    auto getZ = [](const gv::Vec3& p) { return p.z; };
    for (const auto& seg : gen.segments()) {
        EXPECT_LE(circleError(seg.end, getY, getZ, 5.0f, 0.0f, 5.0f), 5e-3f);
        EXPECT_FLOAT_EQ(seg.end.x, 0.0f);
    }
}

TEST(MotionGenerator, ArcWithoutOffsetsSkipped) {
    MotionGenerator gen;
    ModalState state;

    EXPECT_FALSE(gen.arcMove(state, tokenize("X10 Y0"), true, 7));
    EXPECT_TRUE(gen.segments().empty());
    EXPECT_EQ(gen.arcErrorCount(), 1);
    EXPECT_EQ(state.position, gv::Vec3(0, 0, 0));
}

TEST(MotionGenerator, NonFinitePointLeftOutOfBounds) {
    MotionGenerator gen;
    ModalState state;
    gen.linearMove(state, tokenize("X1 Y1"), SegmentType::Cut, 1);

    std::vector<Word> words = {{'X', std::nanf("")}};
    gen.linearMove(state, words, SegmentType::Cut, 2);

    EXPECT_EQ(gen.discardedPointCount(), 1);
    EXPECT_EQ(gen.bounds().max, gv::Vec3(1, 1, 0));
}

TEST(MotionGenerator, Reset) {
    MotionGenerator gen;
    ModalState state;
    gen.linearMove(state, tokenize("X1"), SegmentType::Cut, 1);
    gen.arcMove(state, tokenize("X2"), true, 2);

    gen.reset();
    EXPECT_TRUE(gen.segments().empty());
    EXPECT_FALSE(gen.bounds().isValid());
    EXPECT_EQ(gen.arcErrorCount(), 0);
}
