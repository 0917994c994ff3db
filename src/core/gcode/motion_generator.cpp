#include "motion_generator.h"

#include <algorithm>
#include <cmath>

#include "../utils/log.h"

namespace gv {
namespace gcode {

namespace {

constexpr f64 kPi = 3.14159265358979323846;

// In-plane axes (u, v), the out-of-plane axis w, and the offset letters for (u, v).
// XY: (X, Y) with (I, J); ZX: (Z, X) with (K, I); YZ: (Y, Z) with (J, K).
struct PlaneAxes {
    int u;
    int v;
    int w;
    char offsetU;
    char offsetV;
};

PlaneAxes axesFor(Plane plane) {
    switch (plane) {
    case Plane::ZX: return {2, 0, 1, 'K', 'I'};
    case Plane::YZ: return {1, 2, 0, 'J', 'K'};
    default: return {0, 1, 2, 'I', 'J'};
    }
}

f32& axis(Vec3& p, int index) {
    return index == 0 ? p.x : (index == 1 ? p.y : p.z);
}

f32 axis(const Vec3& p, int index) {
    return index == 0 ? p.x : (index == 1 ? p.y : p.z);
}

} // namespace

void MotionGenerator::reset() {
    *this = MotionGenerator{};
}

Vec3 MotionGenerator::resolveTarget(const ModalState& state,
                                    const std::vector<Word>& words) const {
    Vec3 target = state.position;
    bool absolute = state.positioning == PositioningMode::Absolute;

    for (const auto& word : words) {
        switch (word.letter) {
        case 'X': target.x = absolute ? word.value : state.position.x + word.value; break;
        case 'Y': target.y = absolute ? word.value : state.position.y + word.value; break;
        case 'Z': target.z = absolute ? word.value : state.position.z + word.value; break;
        default: break;
        }
    }

    return target;
}

void MotionGenerator::emit(ModalState& state, SegmentType type, const Vec3& start,
                           const Vec3& end, int lineNumber) {
    Segment segment;
    segment.type = type;
    segment.start = start;
    segment.end = end;
    segment.feedRate = state.feedRate;
    segment.tool = state.currentTool;
    segment.toolChange = state.consumeToolChange();
    segment.lineNumber = lineNumber;
    m_segments.push_back(segment);
}

void MotionGenerator::foldBounds(const Vec3& point, int lineNumber) {
    if (!m_bounds.expand(point)) {
        ++m_discardedPointCount;
        log::warningf("GCode", "Line %d: non-finite point left out of bounds", lineNumber);
    }
}

bool MotionGenerator::linearMove(ModalState& state, const std::vector<Word>& words,
                                 SegmentType type, int lineNumber) {
    Vec3 target = resolveTarget(state, words);
    if (target == state.position) {
        return false; // No movement
    }

    emit(state, type, state.position, target, lineNumber);
    state.position = target;
    foldBounds(target, lineNumber);
    return true;
}

int MotionGenerator::arcSegmentCount(f64 radius, f64 sweep) {
    // Larger and longer arcs get more segments
    f64 raw = std::floor(std::sqrt(std::max(radius, 0.0)) * std::fabs(sweep) * 4.0);
    if (!std::isfinite(raw))
        return kMaxArcSegments;
    return static_cast<int>(std::clamp(raw, static_cast<f64>(kMinArcSegments),
                                       static_cast<f64>(kMaxArcSegments)));
}

bool MotionGenerator::arcMove(ModalState& state, const std::vector<Word>& words,
                              bool clockwise, int lineNumber) {
    auto offI = findWord(words, 'I');
    auto offJ = findWord(words, 'J');
    auto offK = findWord(words, 'K');
    if (!offI && !offJ && !offK) {
        ++m_arcErrorCount;
        log::warningf("GCode", "Arc command at line %d missing I/J/K parameters", lineNumber);
        return false;
    }

    const Vec3 start = state.position;
    const Vec3 target = resolveTarget(state, words);
    const PlaneAxes plane = axesFor(state.plane);

    auto offsetFor = [&](char letter) -> f64 {
        std::optional<f32> value = letter == 'I' ? offI : (letter == 'J' ? offJ : offK);
        return value ? static_cast<f64>(*value) : 0.0;
    };

    // Arc center is the start point plus the in-plane offset
    const f64 startU = axis(start, plane.u);
    const f64 startV = axis(start, plane.v);
    const f64 centerU = startU + offsetFor(plane.offsetU);
    const f64 centerV = startV + offsetFor(plane.offsetV);

    const f64 radius = std::hypot(startU - centerU, startV - centerV);
    const f64 startAngle = std::atan2(startV - centerV, startU - centerU);
    const f64 endAngle = std::atan2(axis(target, plane.v) - centerV,
                                    axis(target, plane.u) - centerU);

    // Sweep sign must match the commanded direction
    f64 sweep = endAngle - startAngle;
    if (clockwise) {
        if (sweep >= 0.0)
            sweep -= 2.0 * kPi;
    } else {
        if (sweep <= 0.0)
            sweep += 2.0 * kPi;
    }

    const int count = arcSegmentCount(radius, sweep);
    const f64 startW = axis(start, plane.w);
    const f64 endW = axis(target, plane.w);

    Vec3 prev = start;
    for (int i = 1; i <= count; ++i) {
        f64 t = static_cast<f64>(i) / static_cast<f64>(count);
        f64 angle = startAngle + sweep * t;

        Vec3 point = start;
        axis(point, plane.u) = static_cast<f32>(centerU + radius * std::cos(angle));
        axis(point, plane.v) = static_cast<f32>(centerV + radius * std::sin(angle));
        axis(point, plane.w) = static_cast<f32>(startW + (endW - startW) * t);

        emit(state, SegmentType::Cut, prev, point, lineNumber);
        foldBounds(point, lineNumber);
        prev = point;
    }

    // Position snaps to the commanded end point, not the last vertex
    state.position = target;
    return true;
}

} // namespace gcode
} // namespace gv
