#ifndef CAPABILITIES_HPP
#define CAPABILITIES_HPP

#include <string>
#include <vector>

struct TelemetrySnapshot;

// Narrow capability contracts between the controller and its drivers.
// Reads are bounded in time; a failed read returns false and leaves the
// out-parameter untouched.

class DistanceSource {
public:
    virtual ~DistanceSource() = default;
    // Up to `count` pings; timed-out or implausible pings are dropped
    virtual void readBurst(int count, std::vector<float>& samples) = 0;
};

class PresenceSource {
public:
    virtual ~PresenceSource() = default;
    virtual bool present() = 0;
};

class GasSource {
public:
    virtual ~GasSource() = default;
    virtual bool readRaw(int& raw) = 0;
};

class LuxSource {
public:
    virtual ~LuxSource() = default;
    virtual bool readLux(float& lux) = 0;
};

class MotionSink {
public:
    virtual ~MotionSink() = default;
    virtual void setAngle(int degrees) = 0;
};

class SignalSink {
public:
    virtual ~SignalSink() = default;
    virtual void setSignal(bool red, bool yellow, bool green) = 0;
};

// Spot LEDs, buzzer, parking lamp and gas alarm LED
class IndicatorSink {
public:
    virtual ~IndicatorSink() = default;
    virtual void setSpot(bool occupied) = 0;
    // frequency 0 silences the buzzer
    virtual void setBuzzer(unsigned frequency_hz, unsigned duty_percent) = 0;
    virtual void setLamp(bool on) = 0;
    virtual void setAlarm(bool on) = 0;
};

class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;
    virtual void publish(const std::string& topic, const std::string& payload) = 0;
};

class DisplaySink {
public:
    virtual ~DisplaySink() = default;
    virtual void render(const TelemetrySnapshot& snapshot) = 0;
};

// Everything one bay controller talks to
struct ParkingIo {
    DistanceSource& distance;
    PresenceSource& entry;
    PresenceSource& exit;
    GasSource&      gas;
    LuxSource&      lux;
    MotionSink&     motion;
    SignalSink&     signal;
    IndicatorSink&  indicators;
    TelemetrySink&  telemetry;
    DisplaySink&    display;
};

#endif // CAPABILITIES_HPP
