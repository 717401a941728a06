#include "GateButton.hpp"
#include "../control/CommandQueue.hpp"

#include <iostream>
#include <pigpio.h>

#define DEBOUNCE_US 50000

GateButton::~GateButton() {
    if (armed_) {
        gpioSetAlertFuncEx(pin_, nullptr, nullptr);
    }
}

bool GateButton::setup() {
    gpioSetMode(pin_, PI_INPUT);
    gpioSetPullUpDown(pin_, PI_PUD_UP);

    if (gpioGlitchFilter(pin_, DEBOUNCE_US) != 0) {
        std::cerr << "[Button] glitch filter setup failed\n";
        return false;
    }
    if (gpioSetAlertFuncEx(pin_, &GateButton::onAlert, this) != 0) {
        std::cerr << "[Button] alert setup failed\n";
        return false;
    }
    armed_ = true;
    return true;
}

void GateButton::onAlert(int gpio, int level, uint32_t tick, void* user) {
    (void)gpio;
    (void)tick;
    if (level != PI_LOW) {
        return;
    }
    auto* self = static_cast<GateButton*>(user);
    Command cmd;
    cmd.type = CommandType::ButtonPress;
    self->queue_.push(cmd);
}
