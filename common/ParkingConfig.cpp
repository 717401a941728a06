#include "ParkingConfig.hpp"

#include <algorithm>
#include <cctype>

const char* lightModeName(LightMode mode) {
    switch (mode) {
        case LightMode::Auto: return "AUTO";
        case LightMode::On:   return "ON";
        case LightMode::Off:  return "OFF";
    }
    return "AUTO";
}

bool parseLightMode(const std::string& text, LightMode& mode) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return false;
    }
    auto last = text.find_last_not_of(" \t\r\n");
    std::string word = text.substr(first, last - first + 1);
    std::transform(word.begin(), word.end(), word.begin(),
                   [](unsigned char c) { return std::toupper(c); });

    if (word == "AUTO") {
        mode = LightMode::Auto;
    } else if (word == "ON") {
        mode = LightMode::On;
    } else if (word == "OFF") {
        mode = LightMode::Off;
    } else {
        return false;
    }
    return true;
}

namespace {

bool inRange(double value, double lo, double hi) {
    return value >= lo && value <= hi;
}

} // namespace

ParkStatus ParkingConfig::setThreshold(const std::string& name, double value) {
    ParkingConfig candidate = *this;
    bool ok = false;

    if (name == "occupied_distance") {
        ok = inRange(value, 1.0, 50.0);
        candidate.occupied_distance_cm = static_cast<float>(value);
    } else if (name == "free_distance") {
        ok = inRange(value, 2.0, 100.0);
        candidate.free_distance_cm = static_cast<float>(value);
    } else if (name == "occupied_confirm") {
        ok = inRange(value, 100.0, 60000.0);
        candidate.occupied_confirm_ms = static_cast<uint32_t>(value);
    } else if (name == "free_confirm") {
        ok = inRange(value, 100.0, 60000.0);
        candidate.free_confirm_ms = static_cast<uint32_t>(value);
    } else if (name == "assist_range") {
        ok = inRange(value, 2.0, 100.0);
        candidate.assist_range_cm = static_cast<float>(value);
    } else if (name == "mq2_threshold") {
        ok = inRange(value, 1.0, 4095.0);
        candidate.gas_threshold = static_cast<int>(value);
    } else if (name == "mq2_hyst") {
        ok = inRange(value, 1.0, 4095.0);
        candidate.gas_hysteresis = static_cast<int>(value);
    } else if (name == "lux_threshold") {
        ok = inRange(value, 0.0, 100000.0);
        candidate.lux_threshold = static_cast<float>(value);
    } else if (name == "servo_step") {
        ok = inRange(value, 1.0, 90.0);
        candidate.servo_step_deg = static_cast<int>(value);
    } else if (name == "servo_interval") {
        ok = inRange(value, 5.0, 1000.0);
        candidate.servo_interval_ms = static_cast<uint32_t>(value);
    } else {
        return ParkStatus::InvalidCommand;
    }

    // Cross-field ordering (dead band, hysteresis below threshold) is part of the range
    if (!ok || !candidate.valid()) {
        return ParkStatus::ConfigOutOfRange;
    }
    *this = candidate;
    return ParkStatus::Ok;
}

void ParkingConfig::resetThresholds() {
    LightMode mode = light_mode;
    *this = defaults();
    light_mode = mode;
}

bool ParkingConfig::threshold(const std::string& name, double& value) const {
    if (name == "occupied_distance")     value = occupied_distance_cm;
    else if (name == "free_distance")    value = free_distance_cm;
    else if (name == "occupied_confirm") value = occupied_confirm_ms;
    else if (name == "free_confirm")     value = free_confirm_ms;
    else if (name == "assist_range")     value = assist_range_cm;
    else if (name == "mq2_threshold")    value = gas_threshold;
    else if (name == "mq2_hyst")         value = gas_hysteresis;
    else if (name == "lux_threshold")    value = lux_threshold;
    else if (name == "servo_step")       value = servo_step_deg;
    else if (name == "servo_interval")   value = servo_interval_ms;
    else return false;
    return true;
}

bool ParkingConfig::valid() const {
    return occupied_distance_cm < free_distance_cm &&
           gas_hysteresis > 0 && gas_hysteresis < gas_threshold &&
           servo_step_deg > 0 &&
           servo_interval_ms > 0;
}
