#include "SignalFilter.hpp"
#include "../common/ParkingConfig.hpp"

#include <algorithm>
#include <numeric>

ParkStatus SignalFilter::update(const std::vector<float>& burst, float& filtered) {
    std::vector<float> readings;
    readings.reserve(burst.size());
    for (float d : burst) {
        if (d > MIN_VALID_DISTANCE_CM && d < MAX_VALID_DISTANCE_CM) {
            readings.push_back(d);
        }
    }

    if (readings.size() < static_cast<std::size_t>(MIN_BURST_SAMPLES)) {
        return ParkStatus::SensorTimeout;
    }

    // Drop the lowest and highest ping
    std::sort(readings.begin(), readings.end());
    float sum = std::accumulate(readings.begin() + 1, readings.end() - 1, 0.0f);
    float burst_avg = sum / static_cast<float>(readings.size() - 2);

    if (!primed_) {
        last_ = burst_avg;
        primed_ = true;
    } else {
        last_ = burst_avg * FILTER_NEW_WEIGHT + last_ * (1.0f - FILTER_NEW_WEIGHT);
    }

    filtered = last_;
    return ParkStatus::Ok;
}
