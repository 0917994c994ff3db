#pragma once

#include <vector>

#include "gcode_types.h"

namespace gv {
namespace gcode {

// Where playback stands: segment index and progress within it (0..1)
struct SeekResult {
    usize index = 0;
    f64 progress = 0.0;
    bool finished = false;

    bool operator==(const SeekResult& other) const {
        return index == other.index && progress == other.progress && finished == other.finished;
    }
};

// Maps elapsed playback distance or time to a segment index.
// Rapids count as zero distance, so they pass instantly in distance mode.
class PlaybackIndex {
  public:
    // Visual feed in distance mode (mm/s at 1x)
    static constexpr f64 kVisualSpeed = 100.0;
    // Segments per second at 1x when neither distance nor time is known
    static constexpr f64 kIndexRate = 100.0;

    static constexpr f64 kMinSpeed = 0.1;
    static constexpr f64 kMaxSpeed = 10.0;

    PlaybackIndex() = default;
    PlaybackIndex(const std::vector<Segment>& segments, f64 totalEstimatedTime) {
        build(segments, totalEstimatedTime);
    }

    void build(const std::vector<Segment>& segments, f64 totalEstimatedTime);

    // Entry i: summed length of the cut segments 0..i
    const std::vector<f64>& cumulativeDistances() const { return m_cumulative; }
    f64 totalDistance() const { return m_totalDistance; }
    f64 totalEstimatedTime() const { return m_totalTime; }
    usize segmentCount() const { return m_cumulative.size(); }

    // Distance mode (mm of cutting travelled)
    SeekResult locate(f64 traveled) const;

    // Time mode (estimated machine seconds)
    SeekResult locateByTime(f64 elapsed) const;

    // Fixed index rate, for files with no feed information at all
    SeekResult locateByRate(f64 elapsedWallSeconds, f64 speed) const;

    // Picks distance, time or fixed-rate mode from what the program offers
    SeekResult seek(f64 elapsedWallSeconds, f64 speed) const;

    static f64 clampSpeed(f64 speed);

    // Slider -10..10 to speed: 0 is 1x, +10 is 10x, -10 is 0.1x
    static f64 sliderToSpeed(f64 value);

  private:
    SeekResult fromIndex(f64 rawIndex) const;

    std::vector<f64> m_cumulative;
    std::vector<bool> m_isCut;
    f64 m_totalDistance = 0.0;
    f64 m_totalTime = 0.0;
};

} // namespace gcode
} // namespace gv
