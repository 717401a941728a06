#ifndef TELEMETRY_HPP
#define TELEMETRY_HPP

#include <string>
#include <utility>
#include <vector>

// One cycle's outbound view of the bay, built once and never modified
struct TelemetrySnapshot {
    std::string gate;        // CHIUSA, PRONTA, APERTURA, ...
    std::string spot;        // LIBERO / OCCUPATO
    float distance_cm = 0;   // clamped to [0, DISPLAY_MAX_DISTANCE]
    int gas_raw = 0;
    std::string gas_alarm;   // OK / ALLARME!
    float lux = 0;

    int gate_angle = 0;
    bool alarm_active = false;
    bool assist_active = false;
};

using TelemetryMessage = std::pair<std::string, std::string>;

// Topic/payload pairs, one per field
std::vector<TelemetryMessage> telemetryMessages(const TelemetrySnapshot& snapshot);

std::string formatDecimal(float value);

#endif // TELEMETRY_HPP
