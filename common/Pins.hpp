#ifndef PINS_HPP
#define PINS_HPP

// BCM GPIO numbers for the bay wiring
constexpr unsigned PIN_IR_ENTRANCE   = 17;
constexpr unsigned PIN_IR_EXIT       = 27;
constexpr unsigned PIN_GATE_BUTTON   = 22;
constexpr unsigned PIN_SERVO         = 12;

constexpr unsigned PIN_TRAFFIC_RED    = 5;
constexpr unsigned PIN_TRAFFIC_YELLOW = 6;
constexpr unsigned PIN_TRAFFIC_GREEN  = 13;

constexpr unsigned PIN_ULTRASONIC_TRIG = 23;
constexpr unsigned PIN_ULTRASONIC_ECHO = 24;

constexpr unsigned PIN_SPOT_RED      = 16;
constexpr unsigned PIN_SPOT_GREEN    = 20;
constexpr unsigned PIN_BUZZER        = 18;
constexpr unsigned PIN_PARKING_LIGHT = 25;
constexpr unsigned PIN_ALARM_LED     = 26;

// I2C bus 1: ADS1115 (MQ-2 on channel 0) and BH1750
constexpr unsigned I2C_BUS         = 1;
constexpr unsigned ADS1115_ADDRESS = 0x48;
constexpr unsigned BH1750_ADDRESS  = 0x23;

#endif // PINS_HPP
