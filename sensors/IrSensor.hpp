#ifndef IRSENSOR_HPP
#define IRSENSOR_HPP

#include "../common/Capabilities.hpp"

// Reflective IR barrier sensor, output pulled low while something is in front
class IrSensor : public PresenceSource {
public:
    explicit IrSensor(unsigned pin) : pin_(pin) {}

    void setup();
    bool present() override;

private:
    unsigned pin_;
};

#endif // IRSENSOR_HPP
