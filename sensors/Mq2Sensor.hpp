#ifndef MQ2SENSOR_HPP
#define MQ2SENSOR_HPP

#include "../common/Capabilities.hpp"

// MQ-2 analog output through an ADS1115, reported on a 12-bit (0-4095) scale
class Mq2Sensor : public GasSource {
public:
    Mq2Sensor(unsigned bus, unsigned address, unsigned channel = 0)
        : bus_(bus), address_(address), channel_(channel) {}
    ~Mq2Sensor() override;

    bool init();
    bool readRaw(int& raw) override;

private:
    unsigned bus_;
    unsigned address_;
    unsigned channel_;
    int handle_ = -1;
};

#endif // MQ2SENSOR_HPP
