#include "Mq2Sensor.hpp"

#include <cstdint>
#include <iostream>
#include <pigpio.h>

#define ADS1115_REG_CONVERSION 0x00
#define ADS1115_REG_CONFIG     0x01
#define ADS1115_CONVERSION_US  9000   // 128 SPS single shot

Mq2Sensor::~Mq2Sensor() {
    if (handle_ >= 0) {
        i2cClose(handle_);
    }
}

bool Mq2Sensor::init() {
    handle_ = i2cOpen(bus_, address_, 0);
    if (handle_ < 0) {
        std::cerr << "[MQ2] ADS1115 open failed: " << handle_ << "\n";
        return false;
    }
    int raw = 0;
    return readRaw(raw);
}

bool Mq2Sensor::readRaw(int& raw) {
    if (handle_ < 0) {
        return false;
    }

    // Single shot, AINx vs GND, +-4.096 V, 128 SPS, comparator off
    uint16_t config = 0x8000 | static_cast<uint16_t>((4 + channel_) << 12) | 0x0200 | 0x0100 | 0x0083;
    char cfg[2] = {static_cast<char>(config >> 8), static_cast<char>(config & 0xFF)};
    if (i2cWriteI2CBlockData(handle_, ADS1115_REG_CONFIG, cfg, 2) != 0) {
        return false;
    }

    gpioDelay(ADS1115_CONVERSION_US);

    char data[2] = {0, 0};
    if (i2cReadI2CBlockData(handle_, ADS1115_REG_CONVERSION, data, 2) != 2) {
        return false;
    }

    int16_t counts = static_cast<int16_t>((static_cast<uint8_t>(data[0]) << 8) |
                                          static_cast<uint8_t>(data[1]));
    if (counts < 0) {
        counts = 0;
    }
    raw = counts >> 3;  // 15 significant bits -> 0..4095
    return true;
}
