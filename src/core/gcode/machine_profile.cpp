#include "machine_profile.h"

#include <cmath>

#include <nlohmann/json.hpp>

#include "../utils/log.h"

namespace gv {
namespace gcode {

namespace {

bool positive(f32 v) {
    return std::isfinite(v) && v > 0.0f;
}

bool nonNegative(f32 v) {
    return std::isfinite(v) && v >= 0.0f;
}

// Copy a numeric key into out; wrong types are logged and leave out untouched
void readNumber(const nlohmann::json& j, const char* key, f32& out) {
    if (!j.contains(key))
        return;
    const auto& value = j[key];
    if (!value.is_number()) {
        log::warningf("Profile", "Ignoring non-numeric '%s'", key);
        return;
    }
    out = value.get<f32>();
}

} // namespace

bool MachineProfile::isValid() const {
    return positive(maxFeedRateX) && positive(maxFeedRateY) && positive(maxFeedRateZ) &&
           positive(accelX) && positive(accelY) && positive(accelZ) && positive(rapidRate) &&
           nonNegative(manualToolChangeTime) && nonNegative(autoToolChangeTime);
}

// --- JSON serialization ---

std::string MachineProfile::toJsonString() const {
    nlohmann::json j{
        {"name", name},
        {"maxFeedRateX", maxFeedRateX},
        {"maxFeedRateY", maxFeedRateY},
        {"maxFeedRateZ", maxFeedRateZ},
        {"accelX", accelX},
        {"accelY", accelY},
        {"accelZ", accelZ},
        {"rapidRate", rapidRate},
        // Tool changes
        {"manualToolChangeTime", manualToolChangeTime},
        {"autoToolChangeTime", autoToolChangeTime},
    };
    return j.dump();
}

MachineProfile MachineProfile::fromJsonString(const std::string& jsonStr) {
    auto j = nlohmann::json::parse(jsonStr, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        log::error("Profile", "Invalid machine profile JSON, using defaults");
        return MachineProfile{};
    }

    MachineProfile p;
    if (j.contains("name") && j["name"].is_string())
        p.name = j["name"].get<std::string>();
    readNumber(j, "maxFeedRateX", p.maxFeedRateX);
    readNumber(j, "maxFeedRateY", p.maxFeedRateY);
    readNumber(j, "maxFeedRateZ", p.maxFeedRateZ);
    readNumber(j, "accelX", p.accelX);
    readNumber(j, "accelY", p.accelY);
    readNumber(j, "accelZ", p.accelZ);
    readNumber(j, "rapidRate", p.rapidRate);
    // Tool changes
    readNumber(j, "manualToolChangeTime", p.manualToolChangeTime);
    readNumber(j, "autoToolChangeTime", p.autoToolChangeTime);
    return p;
}

MachineProfile MachineProfile::defaultProfile() {
    return MachineProfile{};
}

} // namespace gcode
} // namespace gv
