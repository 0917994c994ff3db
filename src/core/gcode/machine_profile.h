#pragma once

#include <string>

#include "../types.h"

namespace gv {
namespace gcode {

// Machine kinematic parameters used by the time estimator.
// Values map to GRBL $ settings where noted.
struct MachineProfile {
    std::string name = "Default";

    // Per-axis max rates (mm/min), GRBL $110/$111/$112
    f32 maxFeedRateX = 3000.0f;
    f32 maxFeedRateY = 3000.0f;
    f32 maxFeedRateZ = 2000.0f;

    // Per-axis acceleration (mm/s^2), GRBL $120/$121/$122
    f32 accelX = 200.0f;
    f32 accelY = 200.0f;
    f32 accelZ = 80.0f;

    // Rapid rate used when no axis limits a rapid move (mm/min)
    f32 rapidRate = 3000.0f;

    // Tool change overhead (seconds)
    f32 manualToolChangeTime = 30.0f;
    f32 autoToolChangeTime = 10.0f;

    // All rates and accelerations positive, tool change times not negative
    bool isValid() const;

    // JSON serialization (returns/accepts JSON string).
    // Missing keys keep their defaults; malformed input yields the default profile.
    std::string toJsonString() const;
    static MachineProfile fromJsonString(const std::string& jsonStr);

    static MachineProfile defaultProfile();
};

} // namespace gcode
} // namespace gv
