#pragma once

#include "../types.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <string>

namespace gv {
namespace gcode {

// Units (tracked only; coordinates are never converted)
enum class Units { Millimeters, Inches };

// Positioning mode
enum class PositioningMode { Absolute, Relative };

// Active arc plane (G17/G18/G19)
enum class Plane { XY, ZX, YZ };

// Motion commands (G0-G3)
enum class MotionMode { Rapid, Linear, ClockwiseArc, CounterClockwiseArc };

enum class SegmentType { Rapid, Cut };

// Tool change pending on the next generated segment
enum class ToolChange {
    None,
    Manual,    // M0 whose comment mentions a tool
    Automatic, // M6
};

// One straight motion between two points. Arcs are emitted as several of these.
struct Segment {
    SegmentType type = SegmentType::Cut;
    Vec3 start;
    Vec3 end;
    f32 feedRate = 0.0f; // mm/min (or in/min), as commanded
    int tool = 1;
    ToolChange toolChange = ToolChange::None;
    int lineNumber = 0;

    bool isRapid() const { return type == SegmentType::Rapid; }
    bool isCut() const { return type == SegmentType::Cut; }
    Vec3 delta() const { return end - start; }
    f32 length() const { return delta().length(); }
    bool isFinite() const { return start.isFinite() && end.isFinite() && std::isfinite(length()); }

    bool operator==(const Segment& other) const {
        return type == other.type && start == other.start && end == other.end &&
               feedRate == other.feedRate && tool == other.tool &&
               toolChange == other.toolChange && lineNumber == other.lineNumber;
    }
};

// Axis-aligned bounds of every emitted segment endpoint
struct Bounds {
    Vec3 min{std::numeric_limits<f32>::infinity(), std::numeric_limits<f32>::infinity(),
             std::numeric_limits<f32>::infinity()};
    Vec3 max{-std::numeric_limits<f32>::infinity(), -std::numeric_limits<f32>::infinity(),
             -std::numeric_limits<f32>::infinity()};

    // False until at least one point has been folded in
    bool isValid() const { return min.x <= max.x && min.y <= max.y && min.z <= max.z; }

    Vec3 size() const { return isValid() ? max - min : Vec3{}; }

    // Returns false (and leaves the bounds untouched) for non-finite points
    bool expand(const Vec3& p) {
        if (!p.isFinite()) {
            return false;
        }
        min.x = std::min(min.x, p.x);
        min.y = std::min(min.y, p.y);
        min.z = std::min(min.z, p.z);
        max.x = std::max(max.x, p.x);
        max.y = std::max(max.y, p.y);
        max.z = std::max(max.z, p.z);
        return true;
    }

    bool operator==(const Bounds& other) const {
        return min == other.min && max == other.max;
    }
};

// A tool described by the program's comments
struct ToolEntry {
    int number = 0;
    std::string name;
    std::optional<u32> color; // 0xRRGGBB when the comment carried #RRGGBB

    bool operator==(const ToolEntry& other) const {
        return number == other.number && name == other.name && color == other.color;
    }
};

}  // namespace gcode
}  // namespace gv
