#ifndef ULTRASONIC_HPP
#define ULTRASONIC_HPP

#include <cstdint>

#include "../common/Capabilities.hpp"

// HC-SR04 on two GPIOs. Every echo wait is bounded so a missing echo costs
// at most ECHO_TIMEOUT_US per ping.
class UltrasonicSensor : public DistanceSource {
public:
    UltrasonicSensor(unsigned trig_pin, unsigned echo_pin)
        : trig_pin_(trig_pin), echo_pin_(echo_pin) {}

    void setup();
    void readBurst(int count, std::vector<float>& samples) override;

private:
    bool ping(float& distance_cm);
    bool waitLevel(int level, uint32_t start_tick, uint32_t& tick);

    unsigned trig_pin_;
    unsigned echo_pin_;
};

#endif // ULTRASONIC_HPP
