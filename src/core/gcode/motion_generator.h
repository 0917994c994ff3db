#pragma once

#include <vector>

#include "gcode_tokenizer.h"
#include "gcode_types.h"
#include "modal_state.h"

namespace gv {
namespace gcode {

// Turns G0/G1 into single segments and G2/G3 into tessellated polylines.
// Reads and advances the position held in ModalState; keeps the running bounds.
class MotionGenerator {
  public:
    static constexpr int kMinArcSegments = 8;
    static constexpr int kMaxArcSegments = 64;

    void reset();

    // G0/G1. Returns false when the target equals the current position.
    bool linearMove(ModalState& state, const std::vector<Word>& words, SegmentType type,
                    int lineNumber);

    // G2/G3. Returns false (and logs) when the line has no I/J/K offset.
    bool arcMove(ModalState& state, const std::vector<Word>& words, bool clockwise,
                 int lineNumber);

    // Segment count used for an arc of this radius and sweep (radians)
    static int arcSegmentCount(f64 radius, f64 sweep);

    const std::vector<Segment>& segments() const { return m_segments; }
    const Bounds& bounds() const { return m_bounds; }
    int arcErrorCount() const { return m_arcErrorCount; }
    int discardedPointCount() const { return m_discardedPointCount; }

  private:
    Vec3 resolveTarget(const ModalState& state, const std::vector<Word>& words) const;
    void emit(ModalState& state, SegmentType type, const Vec3& start, const Vec3& end,
              int lineNumber);
    void foldBounds(const Vec3& point, int lineNumber);

    std::vector<Segment> m_segments;
    Bounds m_bounds;
    int m_arcErrorCount = 0;
    int m_discardedPointCount = 0;
};

} // namespace gcode
} // namespace gv
