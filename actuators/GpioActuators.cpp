#include "GpioActuators.hpp"
#include "../common/ParkingConfig.hpp"

#include <algorithm>
#include <initializer_list>
#include <pigpio.h>

#define SERVO_MIN_PULSE_US 500
#define SERVO_MAX_PULSE_US 2500
#define PWM_RANGE          100

void ServoGate::setup() {
    gpioSetMode(pin_, PI_OUTPUT);
    setAngle(GATE_CLOSED_ANGLE);
}

void ServoGate::setAngle(int degrees) {
    int logical = std::clamp(degrees, 0, 180);
    if (logical == written_) {
        return;
    }
    int physical = std::clamp(90 - logical, 0, 180);
    unsigned pulse = SERVO_MIN_PULSE_US +
                     static_cast<unsigned>(physical * (SERVO_MAX_PULSE_US - SERVO_MIN_PULSE_US) / 180);
    gpioServo(pin_, pulse);
    written_ = logical;
}

void TrafficLight::setup() {
    for (unsigned pin : {red_, yellow_, green_}) {
        gpioSetMode(pin, PI_OUTPUT);
        gpioWrite(pin, PI_LOW);
    }
}

void TrafficLight::setSignal(bool red, bool yellow, bool green) {
    gpioWrite(red_, red ? PI_HIGH : PI_LOW);
    gpioWrite(yellow_, yellow ? PI_HIGH : PI_LOW);
    gpioWrite(green_, green ? PI_HIGH : PI_LOW);
}

void BayIndicators::setup() {
    for (unsigned pin : {pins_.spot_red, pins_.spot_green, pins_.buzzer, pins_.lamp, pins_.alarm}) {
        gpioSetMode(pin, PI_OUTPUT);
    }
    gpioSetPWMrange(pins_.buzzer, PWM_RANGE);
    gpioSetPWMrange(pins_.lamp, PWM_RANGE);
    allOff();
}

void BayIndicators::allOff() {
    gpioWrite(pins_.spot_red, PI_LOW);
    gpioWrite(pins_.spot_green, PI_LOW);
    gpioPWM(pins_.buzzer, 0);
    gpioPWM(pins_.lamp, 0);
    gpioWrite(pins_.alarm, PI_LOW);
    buzzer_hz_ = 0;
    buzzer_duty_ = 0;
}

void BayIndicators::setSpot(bool occupied) {
    gpioWrite(pins_.spot_red, occupied ? PI_HIGH : PI_LOW);
    gpioWrite(pins_.spot_green, occupied ? PI_LOW : PI_HIGH);
}

void BayIndicators::setBuzzer(unsigned frequency_hz, unsigned duty_percent) {
    unsigned duty = frequency_hz ? std::min(duty_percent, 100u) : 0;
    if (frequency_hz == buzzer_hz_ && duty == buzzer_duty_) {
        return;
    }
    if (frequency_hz != 0 && frequency_hz != buzzer_hz_) {
        // pigpio picks the nearest frequency its sample rate supports
        gpioSetPWMfrequency(pins_.buzzer, frequency_hz);
    }
    gpioPWM(pins_.buzzer, duty);
    buzzer_hz_ = frequency_hz;
    buzzer_duty_ = duty;
}

void BayIndicators::setLamp(bool on) {
    gpioPWM(pins_.lamp, on ? PWM_RANGE : 0);
}

void BayIndicators::setAlarm(bool on) {
    gpioWrite(pins_.alarm, on ? PI_HIGH : PI_LOW);
}
