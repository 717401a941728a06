#ifndef GASMONITOR_HPP
#define GASMONITOR_HPP

#include <cstdint>

#include "../common/ParkingConfig.hpp"

enum class GasState { Ok, Alarm };

const char* gasLabel(GasState state);

// MQ-2 alarm with a banded clear: raises at reading >= threshold and clears
// only at reading <= threshold - hysteresis. Single samples are trusted.
class GasMonitor {
public:
    // Returns true when the alarm state changed
    bool update(int raw, uint64_t now_ms, const ParkingConfig& config);

    GasState state() const { return state_; }
    bool alarm() const { return state_ == GasState::Alarm; }
    int lastReading() const { return last_raw_; }
    uint64_t alarmSince() const { return alarm_since_ms_; }

private:
    GasState state_ = GasState::Ok;
    int last_raw_ = 0;
    uint64_t alarm_since_ms_ = 0;
};

#endif // GASMONITOR_HPP
