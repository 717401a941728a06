#ifndef SIGNALFILTER_HPP
#define SIGNALFILTER_HPP

#include <vector>

#include "../common/ParkStatus.hpp"

// Turns a burst of ultrasonic pings into one stable distance estimate:
// trimmed mean of the burst, then a 70/30 low-pass against the previous estimate.
class SignalFilter {
public:
    // Fewer than MIN_BURST_SAMPLES plausible samples gives SensorTimeout and
    // leaves both the estimate and `filtered` untouched.
    ParkStatus update(const std::vector<float>& burst, float& filtered);

    bool primed() const { return primed_; }
    float last() const { return last_; }

private:
    bool primed_ = false;
    float last_ = 0.0f;
};

#endif // SIGNALFILTER_HPP
