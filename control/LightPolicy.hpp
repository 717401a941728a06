#ifndef LIGHTPOLICY_HPP
#define LIGHTPOLICY_HPP

#include "../common/ParkingConfig.hpp"

// Lamp decision: ON and OFF force the lamp, AUTO lights it below the lux threshold
bool lampOn(LightMode mode, float lux, float lux_threshold);

// Keeps the last good ambient reading so a failed lux read holds the lamp steady
class LightPolicy {
public:
    void observe(float lux) { lux_ = lux; }
    bool decide(const ParkingConfig& config) const {
        return lampOn(config.light_mode, lux_, config.lux_threshold);
    }
    float lux() const { return lux_; }

private:
    float lux_ = 0.0f;
};

#endif // LIGHTPOLICY_HPP
