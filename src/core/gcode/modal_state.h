#pragma once

#include "gcode_types.h"

namespace gv {
namespace gcode {

// Interpreter state that persists from line to line until a word changes it.
// Owned by the Parser and threaded through every line; reset before each parse.
struct ModalState {
    Vec3 position;
    Units units = Units::Millimeters;                      // G20 / G21
    PositioningMode positioning = PositioningMode::Absolute; // G90 / G91
    Plane plane = Plane::XY;                               // G17 / G18 / G19
    f32 feedRate = 0.0f;                                   // F value
    int currentTool = 1;                                   // Tool 0 = no tool
    ToolChange pendingToolChange = ToolChange::None;

    void reset();

    // Hand the pending tool change to the segment being generated and clear it
    ToolChange consumeToolChange();

    // Apply a non-motion G code (plane, units, positioning). Returns false if unknown.
    bool applyModalCode(int code);
};

} // namespace gcode
} // namespace gv
