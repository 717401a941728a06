#ifndef GPIOACTUATORS_HPP
#define GPIOACTUATORS_HPP

#include "../common/Capabilities.hpp"

// Barrier servo. The horn is mounted reversed, so logical 0..90 deg is
// written as 90..0 deg on the pulse.
class ServoGate : public MotionSink {
public:
    explicit ServoGate(unsigned pin) : pin_(pin) {}

    void setup();
    void setAngle(int degrees) override;

private:
    unsigned pin_;
    int written_ = -1;
};

class TrafficLight : public SignalSink {
public:
    TrafficLight(unsigned red, unsigned yellow, unsigned green)
        : red_(red), yellow_(yellow), green_(green) {}

    void setup();
    void setSignal(bool red, bool yellow, bool green) override;

private:
    unsigned red_;
    unsigned yellow_;
    unsigned green_;
};

struct IndicatorPins {
    unsigned spot_red;
    unsigned spot_green;
    unsigned buzzer;
    unsigned lamp;
    unsigned alarm;
};

class BayIndicators : public IndicatorSink {
public:
    explicit BayIndicators(const IndicatorPins& pins) : pins_(pins) {}

    void setup();
    // Spot LEDs, buzzer, lamp and alarm LED all off
    void allOff();

    void setSpot(bool occupied) override;
    void setBuzzer(unsigned frequency_hz, unsigned duty_percent) override;
    void setLamp(bool on) override;
    void setAlarm(bool on) override;

private:
    IndicatorPins pins_;
    unsigned buzzer_hz_ = 0;
    unsigned buzzer_duty_ = 0;
};

#endif // GPIOACTUATORS_HPP
