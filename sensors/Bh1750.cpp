#include "Bh1750.hpp"

#include <iostream>
#include <pigpio.h>

#define BH1750_POWER_ON         0x01
#define BH1750_CONT_HIGH_RES    0x10

Bh1750::~Bh1750() {
    if (handle_ >= 0) {
        i2cClose(handle_);
    }
}

bool Bh1750::init() {
    handle_ = i2cOpen(bus_, address_, 0);
    if (handle_ < 0) {
        std::cerr << "[BH1750] open failed: " << handle_ << "\n";
        return false;
    }
    if (i2cWriteByte(handle_, BH1750_POWER_ON) != 0 ||
        i2cWriteByte(handle_, BH1750_CONT_HIGH_RES) != 0) {
        std::cerr << "[BH1750] mode setup failed\n";
        i2cClose(handle_);
        handle_ = -1;
        return false;
    }
    return true;
}

bool Bh1750::readLux(float& lux) {
    if (handle_ < 0) {
        return false;
    }
    char data[2] = {0, 0};
    if (i2cReadDevice(handle_, data, 2) != 2) {
        return false;
    }
    unsigned counts = (static_cast<uint8_t>(data[0]) << 8) | static_cast<uint8_t>(data[1]);
    lux = static_cast<float>(counts) / 1.2f;
    return true;
}
