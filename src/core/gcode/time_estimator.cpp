#include "time_estimator.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

#include "../utils/log.h"

namespace gv {
namespace gcode {

namespace {

// Axis displacements at or below this don't limit rate or acceleration
constexpr f64 kAxisEpsilon = 1e-3;
// Squared gap above which two segments are not considered connected
constexpr f64 kJunctionGapSq = 1e-6;
// Direction cosine treated as a straight continuation
constexpr f64 kCollinearCos = 0.999;

} // namespace

TimeEstimate TimeEstimator::estimate(const std::vector<Segment>& segments) const {
    TimeEstimate result;
    result.segmentTimes.reserve(segments.size());

    for (usize i = 0; i < segments.size(); ++i) {
        const Segment& seg = segments[i];

        f64 length = seg.isFinite() ? seg.length() : 0.0;
        if (seg.isCut()) {
            result.cuttingPathLength += length;
        } else {
            result.rapidPathLength += length;
        }

        if (seg.toolChange == ToolChange::Manual) {
            result.manualToolChanges++;
        } else if (seg.toolChange == ToolChange::Automatic) {
            result.automaticToolChanges++;
        }

        f64 time = segmentTime(segments, i);
        result.segmentTimes.push_back(time);
        result.totalSeconds += time;

        if (seg.isCut()) {
            int tool = seg.tool != 0 ? seg.tool : 1;
            result.toolSeconds[tool] += time;
        }
    }

    log::debugf("Estimator", "%zu segments, %.1f s total, %d manual / %d automatic tool changes",
                segments.size(), result.totalSeconds, result.manualToolChanges,
                result.automaticToolChanges);

    return result;
}

f64 TimeEstimator::segmentTime(const std::vector<Segment>& segments, usize index) const {
    const Segment& seg = segments[index];
    const Segment* prev = index > 0 ? &segments[index - 1] : nullptr;
    const Segment* next = index + 1 < segments.size() ? &segments[index + 1] : nullptr;
    if (prev && !prev->isFinite())
        prev = nullptr;
    if (next && !next->isFinite())
        next = nullptr;

    // Tool change overhead is added on top of the move
    f64 time = 0.0;
    if (seg.toolChange == ToolChange::Manual) {
        time += m_profile.manualToolChangeTime;
    } else if (seg.toolChange == ToolChange::Automatic) {
        time += m_profile.autoToolChangeTime;
    }

    if (!seg.isFinite()) {
        log::warningf("Estimator", "Skipping non-finite segment from line %d", seg.lineNumber);
        return time;
    }

    if (seg.isCut()) {
        if (seg.feedRate <= 0.0f)
            return time;

        f64 feed = seg.feedRate;
        f64 prevFeed = prev && prev->isCut() ? prev->feedRate : 0.0;
        f64 nextFeed = next && next->isCut() ? next->feedRate : 0.0;

        f64 entry = calculateJunctionVelocity(prev, &seg, prevFeed, feed);
        f64 exit = calculateJunctionVelocity(&seg, next, feed, nextFeed);
        return time + calculateMoveTime(seg, feed, entry, exit);
    }

    if (seg.length() <= 0.0f)
        return time;

    // Rapids only blend with neighbouring rapids
    f64 rate = rapidFeedRate(seg);
    f64 entry = prev && prev->isRapid() ? calculateJunctionVelocity(prev, &seg, rate, rate) : 0.0;
    f64 exit = next && next->isRapid() ? calculateJunctionVelocity(&seg, next, rate, rate) : 0.0;
    return time + calculateMoveTime(seg, rate, entry, exit);
}

f64 TimeEstimator::rapidFeedRate(const Segment& segment) const {
    Vec3 d = segment.delta();
    f64 distance = d.length();
    if (distance <= 0.0)
        return m_profile.rapidRate;

    // Rate at which the slowest axis reaches its ceiling over the same span
    f64 rate = std::numeric_limits<f64>::infinity();
    auto limit = [&](f64 axisDelta, f64 ceiling) {
        if (std::fabs(axisDelta) > kAxisEpsilon) {
            f64 axisTime = std::fabs(axisDelta) / (ceiling / 60.0);
            rate = std::min(rate, (distance / axisTime) * 60.0);
        }
    };
    limit(d.x, m_profile.maxFeedRateX);
    limit(d.y, m_profile.maxFeedRateY);
    limit(d.z, m_profile.maxFeedRateZ);

    if (std::isinf(rate))
        rate = m_profile.rapidRate;
    return rate;
}

f64 TimeEstimator::effectiveAccel(const Vec3& delta) const {
    f64 accel = std::numeric_limits<f64>::infinity();

    if (std::fabs(delta.x) > kAxisEpsilon) {
        accel = std::min(accel, static_cast<f64>(m_profile.accelX));
    }
    if (std::fabs(delta.y) > kAxisEpsilon) {
        accel = std::min(accel, static_cast<f64>(m_profile.accelY));
    }
    if (std::fabs(delta.z) > kAxisEpsilon) {
        accel = std::min(accel, static_cast<f64>(m_profile.accelZ));
    }

    if (std::isinf(accel)) {
        accel = m_profile.accelX;
    }

    return accel;
}

f64 TimeEstimator::calculateMoveTime(const Segment& segment, f64 feedRate, f64 entryVelocity,
                                     f64 exitVelocity) const {
    f64 distance = segment.length();
    if (distance <= 0.0 || feedRate <= 0.0)
        return 0.0;

    f64 target = feedRate / 60.0;
    f64 accel = effectiveAccel(segment.delta());

    f64 entry = std::min(entryVelocity, target);
    f64 exit = std::min(exitVelocity, target);

    f64 accelDistance = (target * target - entry * entry) / (2.0 * accel);
    f64 decelDistance = (target * target - exit * exit) / (2.0 * accel);

    if (accelDistance + decelDistance >= distance) {
        // Triangle profile: peaks below the target velocity
        f64 peakSq = (entry * entry + exit * exit) / 2.0 + accel * distance;
        f64 peak = std::sqrt(std::max(0.0, peakSq));
        return (peak - entry) / accel + (peak - exit) / accel;
    }

    // Full trapezoid: accelerate, cruise, decelerate
    f64 cruise = (distance - accelDistance - decelDistance) / target;
    return (target - entry) / accel + cruise + (target - exit) / accel;
}

f64 TimeEstimator::calculateJunctionVelocity(const Segment* a, const Segment* b, f64 feedA,
                                             f64 feedB) {
    if (!a || !b)
        return 0.0;
    if (a->tool != b->tool || a->type != b->type)
        return 0.0;

    Vec3 gap = b->start - a->end;
    if (static_cast<f64>(gap.lengthSquared()) >= kJunctionGapSq)
        return 0.0;

    Vec3 da = a->delta();
    Vec3 db = b->delta();
    f64 lenA = da.length();
    f64 lenB = db.length();
    if (lenA <= 0.0 || lenB <= 0.0)
        return 0.0;

    f64 cosAngle = static_cast<f64>(da.dot(db)) / (lenA * lenB);
    f64 full = std::min(feedA, feedB) / 60.0;

    if (cosAngle > kCollinearCos)
        return full;

    // 0 at a full reversal, full speed when straight
    return full * (1.0 + cosAngle) / 2.0;
}

std::string TimeEstimator::formatDuration(f64 seconds) {
    if (seconds == 0.0 || !std::isfinite(seconds))
        return "-";

    long total = static_cast<long>(std::floor(std::max(seconds, 0.0)));
    long h = total / 3600;
    long m = (total % 3600) / 60;
    long s = total % 60;

    char buf[64];
    if (h > 0) {
        std::snprintf(buf, sizeof(buf), "%ldh %ldm %lds", h, m, s);
    } else if (m > 0) {
        std::snprintf(buf, sizeof(buf), "%ldm %lds", m, s);
    } else {
        std::snprintf(buf, sizeof(buf), "%lds", s);
    }
    return buf;
}

} // namespace gcode
} // namespace gv
