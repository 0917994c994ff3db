#include "types.h"

#include <cmath>

namespace gv {

f32 Vec3::length() const {
    return std::sqrt(x * x + y * y + z * z);
}

bool Vec3::isFinite() const {
    return std::isfinite(x) && std::isfinite(y) && std::isfinite(z);
}

}  // namespace gv
