#include "playback_index.h"

#include <algorithm>
#include <cmath>

#include "../utils/log.h"

namespace gv {
namespace gcode {

void PlaybackIndex::build(const std::vector<Segment>& segments, f64 totalEstimatedTime) {
    m_cumulative.clear();
    m_isCut.clear();
    m_cumulative.reserve(segments.size());
    m_isCut.reserve(segments.size());

    f64 total = 0.0;
    for (const auto& seg : segments) {
        if (seg.isCut() && seg.isFinite()) {
            total += seg.length();
        }
        m_cumulative.push_back(total);
        m_isCut.push_back(seg.isCut());
    }

    m_totalDistance = total;
    m_totalTime = std::isfinite(totalEstimatedTime) ? std::max(totalEstimatedTime, 0.0) : 0.0;

    log::debugf("Playback", "Index over %zu segments, %.3f mm cutting, %.1f s", segments.size(),
                m_totalDistance, m_totalTime);
}

SeekResult PlaybackIndex::locate(f64 traveled) const {
    const usize count = m_cumulative.size();
    if (count == 0)
        return {0, 1.0, true};

    traveled = std::max(traveled, 0.0);
    if (traveled >= m_totalDistance)
        return {count - 1, 1.0, true};

    // Smallest index whose cumulative distance reaches traveled
    auto it = std::lower_bound(m_cumulative.begin(), m_cumulative.end(), traveled);
    usize index = static_cast<usize>(it - m_cumulative.begin());

    f64 startDistance = index > 0 ? m_cumulative[index - 1] : 0.0;
    f64 segmentDistance = m_cumulative[index] - startDistance;

    SeekResult result{index, 1.0, false};
    if (m_isCut[index] && segmentDistance > 0.0) {
        result.progress = std::clamp((traveled - startDistance) / segmentDistance, 0.0, 1.0);
    }
    return result;
}

SeekResult PlaybackIndex::fromIndex(f64 rawIndex) const {
    const usize count = m_cumulative.size();
    if (count == 0)
        return {0, 1.0, true};

    f64 floored = std::floor(std::max(rawIndex, 0.0));
    if (!std::isfinite(floored) || floored >= static_cast<f64>(count))
        return {count - 1, 1.0, true};

    return {static_cast<usize>(floored), 1.0, false};
}

SeekResult PlaybackIndex::locateByTime(f64 elapsed) const {
    if (m_totalTime <= 0.0)
        return fromIndex(0.0);
    return fromIndex(elapsed / m_totalTime * static_cast<f64>(m_cumulative.size()));
}

SeekResult PlaybackIndex::locateByRate(f64 elapsedWallSeconds, f64 speed) const {
    return fromIndex(kIndexRate * clampSpeed(speed) * elapsedWallSeconds);
}

SeekResult PlaybackIndex::seek(f64 elapsedWallSeconds, f64 speed) const {
    f64 rate = clampSpeed(speed);

    if (m_totalDistance > 0.0)
        return locate(kVisualSpeed * rate * elapsedWallSeconds);

    if (m_totalTime > 0.0)
        return locateByTime(elapsedWallSeconds * rate);

    return locateByRate(elapsedWallSeconds, rate);
}

f64 PlaybackIndex::clampSpeed(f64 speed) {
    if (!std::isfinite(speed))
        return 1.0;
    return std::clamp(speed, kMinSpeed, kMaxSpeed);
}

f64 PlaybackIndex::sliderToSpeed(f64 value) {
    if (value == 0.0)
        return 1.0;
    if (value > 0.0)
        return 1.0 + (value / 10.0) * 9.0;
    return 1.0 + (value / 10.0) * 0.9;
}

} // namespace gcode
} // namespace gv
