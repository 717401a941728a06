#include "Ultrasonic.hpp"
#include "../common/ParkingConfig.hpp"

#include <cstdint>
#include <pigpio.h>

#define TRIGGER_PULSE_US 10
#define ECHO_TIMEOUT_US  25000   // ~4 m round trip
#define BURST_GAP_US     3000
#define US_PER_CM        58.0f

void UltrasonicSensor::setup() {
    gpioSetMode(trig_pin_, PI_OUTPUT);
    gpioWrite(trig_pin_, PI_LOW);
    gpioSetMode(echo_pin_, PI_INPUT);
}

bool UltrasonicSensor::waitLevel(int level, uint32_t start_tick, uint32_t& tick) {
    while (gpioRead(echo_pin_) != level) {
        tick = gpioTick();
        if (tick - start_tick > ECHO_TIMEOUT_US) {
            return false;
        }
    }
    tick = gpioTick();
    return true;
}

bool UltrasonicSensor::ping(float& distance_cm) {
    if (gpioTrigger(trig_pin_, TRIGGER_PULSE_US, PI_HIGH) != 0) {
        return false;
    }

    uint32_t start = gpioTick();
    uint32_t rise = start;
    if (!waitLevel(PI_HIGH, start, rise)) {
        return false;
    }
    uint32_t fall = rise;
    if (!waitLevel(PI_LOW, rise, fall)) {
        return false;
    }

    distance_cm = static_cast<float>(fall - rise) / US_PER_CM;
    return true;
}

void UltrasonicSensor::readBurst(int count, std::vector<float>& samples) {
    samples.clear();
    for (int i = 0; i < count; ++i) {
        float d = 0.0f;
        if (ping(d) && d > MIN_VALID_DISTANCE_CM && d < MAX_VALID_DISTANCE_CM) {
            samples.push_back(d);
        }
        gpioDelay(BURST_GAP_US);
    }
}
