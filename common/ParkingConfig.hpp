#ifndef PARKINGCONFIG_HPP
#define PARKINGCONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "ParkStatus.hpp"

enum class LightMode { Auto, On, Off };

const char* lightModeName(LightMode mode);
// Accepts AUTO/ON/OFF in any case, surrounding whitespace ignored
bool parseLightMode(const std::string& text, LightMode& mode);

// Fixed timing and signal-processing constants
constexpr int      BURST_SIZE             = 7;
constexpr int      MIN_BURST_SAMPLES      = 3;
constexpr float    MIN_VALID_DISTANCE_CM  = 0.5f;
constexpr float    MAX_VALID_DISTANCE_CM  = 300.0f;
constexpr float    FILTER_NEW_WEIGHT      = 0.7f;
constexpr float    DISPLAY_MAX_DISTANCE   = 8.0f;
constexpr uint32_t SETTLE_DELAY_MS        = 1000;
constexpr uint32_t BLINK_INTERVAL_MS      = 150;
constexpr uint32_t CONTROL_TICK_MS        = 30;
constexpr uint32_t SENSE_INTERVAL_MS      = 200;
constexpr uint32_t TELEMETRY_INTERVAL_MS  = 2000;
constexpr int      GATE_OPEN_ANGLE        = 90;
constexpr int      GATE_CLOSED_ANGLE      = 0;
constexpr unsigned GAS_ALARM_TONE_HZ      = 2500;
constexpr uint32_t GAS_ALARM_BEEP_MS      = 300;
constexpr unsigned ASSIST_STOP_TONE_HZ    = 2000;
constexpr unsigned ASSIST_SLOW_TONE_HZ    = 1500;
constexpr unsigned ASSIST_APPROACH_TONE_HZ = 800;
constexpr unsigned BUZZER_DUTY_PERCENT    = 50;
constexpr std::size_t COMMAND_QUEUE_CAPACITY = 16;

// Tunable thresholds. One record per bay; the controller is the only writer,
// through setThreshold()/resetThresholds() while applying commands.
struct ParkingConfig {
    float    occupied_distance_cm = 3.0f;
    float    free_distance_cm     = 9.0f;
    uint32_t occupied_confirm_ms  = 3000;
    uint32_t free_confirm_ms      = 2000;
    float    assist_range_cm      = 7.0f;

    int      gas_threshold        = 1500;  // raw ADC counts (0-4095)
    int      gas_hysteresis       = 200;

    float    lux_threshold        = 50.0f;
    LightMode light_mode          = LightMode::Auto;

    int      servo_step_deg       = 2;
    uint32_t servo_interval_ms    = 30;

    static ParkingConfig defaults() { return ParkingConfig{}; }

    ParkStatus setThreshold(const std::string& name, double value);
    // Restores compiled defaults for every threshold, light mode untouched
    void resetThresholds();
    // Current value of a named threshold, false for unknown names
    bool threshold(const std::string& name, double& value) const;
    bool valid() const;
};

#endif // PARKINGCONFIG_HPP
