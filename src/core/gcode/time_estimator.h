#pragma once

#include <map>
#include <string>
#include <vector>

#include "gcode_types.h"
#include "machine_profile.h"

namespace gv {
namespace gcode {

// Estimated run time of a segment list
struct TimeEstimate {
    f64 totalSeconds = 0.0;
    std::map<int, f64> toolSeconds; // Cut time per tool, tool 0 booked under 1
    std::vector<f64> segmentTimes;  // Per segment, tool change overhead included

    f64 cuttingPathLength = 0.0;
    f64 rapidPathLength = 0.0;
    int manualToolChanges = 0;
    int automaticToolChanges = 0;

    f64 toolSecondsFor(int tool) const {
        auto it = toolSeconds.find(tool);
        return it != toolSeconds.end() ? it->second : 0.0;
    }
};

// Trapezoidal velocity model with junction velocities between neighbouring moves.
// All rates passed in and out are mm/min; velocities are mm/s.
class TimeEstimator {
  public:
    TimeEstimator() = default;
    explicit TimeEstimator(const MachineProfile& profile) : m_profile(profile) {}

    void setMachineProfile(const MachineProfile& profile) { m_profile = profile; }
    const MachineProfile& machineProfile() const { return m_profile; }

    TimeEstimate estimate(const std::vector<Segment>& segments) const;

    // Seconds to traverse segment at feedRate (mm/min), entering and leaving at the
    // given velocities (mm/s). Zero-length segments take no time.
    f64 calculateMoveTime(const Segment& segment, f64 feedRate, f64 entryVelocity = 0.0,
                          f64 exitVelocity = 0.0) const;

    // Velocity (mm/s) shared by a and b at their common point; 0 when they don't
    // connect, differ in tool or type, or either is missing or degenerate
    static f64 calculateJunctionVelocity(const Segment* a, const Segment* b, f64 feedA,
                                         f64 feedB);

    // Compound rate (mm/min) of a rapid move limited by the slowest axis
    f64 rapidFeedRate(const Segment& segment) const;

    // Lowest acceleration (mm/s^2) among the axes the move uses
    f64 effectiveAccel(const Vec3& delta) const;

    // "1h 2m 3s", "2m 3s", "3s"; zero renders as "-"
    static std::string formatDuration(f64 seconds);

  private:
    f64 segmentTime(const std::vector<Segment>& segments, usize index) const;

    MachineProfile m_profile;
};

} // namespace gcode
} // namespace gv
