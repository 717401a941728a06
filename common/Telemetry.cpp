#include "Telemetry.hpp"

#include <cstdio>

std::string formatDecimal(float value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", value);
    return buf;
}

std::vector<TelemetryMessage> telemetryMessages(const TelemetrySnapshot& snapshot) {
    return {
        {"parking/state/gate", snapshot.gate},
        {"parking/state/spot", snapshot.spot},
        {"parking/ultrasonic/distance", formatDecimal(snapshot.distance_cm)},
        {"parking/sensors/gas", std::to_string(snapshot.gas_raw)},
        {"parking/alarms/gas", snapshot.gas_alarm},
        {"parking/env/light", formatDecimal(snapshot.lux)},
    };
}
