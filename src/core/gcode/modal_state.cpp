#include "modal_state.h"

namespace gv {
namespace gcode {

void ModalState::reset() {
    *this = ModalState{};
}

ToolChange ModalState::consumeToolChange() {
    ToolChange change = pendingToolChange;
    pendingToolChange = ToolChange::None;
    return change;
}

bool ModalState::applyModalCode(int code) {
    switch (code) {
    case 17: plane = Plane::XY; break;
    case 18: plane = Plane::ZX; break;
    case 19: plane = Plane::YZ; break;
    case 20: units = Units::Inches; break;
    case 21: units = Units::Millimeters; break;
    case 90: positioning = PositioningMode::Absolute; break;
    case 91: positioning = PositioningMode::Relative; break;
    default: return false;
    }
    return true;
}

} // namespace gcode
} // namespace gv
