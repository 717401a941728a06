#include "IrSensor.hpp"
#include <pigpio.h>

void IrSensor::setup() {
    gpioSetMode(pin_, PI_INPUT);
    gpioSetPullUpDown(pin_, PI_PUD_UP);
}

bool IrSensor::present() {
    return gpioRead(pin_) == PI_LOW;
}
