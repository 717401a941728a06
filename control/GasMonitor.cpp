#include "GasMonitor.hpp"

#include <sys/syslog.h>

const char* gasLabel(GasState state) {
    return state == GasState::Alarm ? "ALLARME!" : "OK";
}

bool GasMonitor::update(int raw, uint64_t now_ms, const ParkingConfig& config) {
    last_raw_ = raw;

    if (state_ == GasState::Ok && raw >= config.gas_threshold) {
        state_ = GasState::Alarm;
        alarm_since_ms_ = now_ms;
        syslog(LOG_WARNING, "Gas alarm raised, raw %d (threshold %d)", raw, config.gas_threshold);
        return true;
    }

    if (state_ == GasState::Alarm && raw <= config.gas_threshold - config.gas_hysteresis) {
        state_ = GasState::Ok;
        syslog(LOG_INFO, "Gas alarm cleared, raw %d", raw);
        return true;
    }

    return false;
}
