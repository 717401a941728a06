#include "OccupancyTracker.hpp"

#include <sys/syslog.h>

const char* occupancyLabel(OccupancyState state) {
    return state == OccupancyState::Occupied ? "OCCUPATO" : "LIBERO";
}

const char* assistZoneName(AssistZone zone) {
    switch (zone) {
        case AssistZone::Stop:     return "STOP";
        case AssistZone::Slow:     return "SLOW";
        case AssistZone::Approach: return "APPROACH";
        case AssistZone::None:     return "NONE";
    }
    return "NONE";
}

AssistZone classifyAssistZone(float distance_cm, const ParkingConfig& config) {
    if (distance_cm <= config.occupied_distance_cm) {
        return AssistZone::Stop;
    }
    if (distance_cm < config.assist_range_cm / 2.0f) {
        return AssistZone::Slow;
    }
    if (distance_cm <= config.assist_range_cm) {
        return AssistZone::Approach;
    }
    return AssistZone::None;
}

bool OccupancyTracker::update(float distance_cm, uint64_t now_ms, const ParkingConfig& config) {
    bool candidate;
    uint32_t confirm_ms;

    if (state_ == OccupancyState::Free) {
        candidate = distance_cm <= config.occupied_distance_cm;
        confirm_ms = config.occupied_confirm_ms;
    } else {
        candidate = distance_cm > config.free_distance_cm;
        confirm_ms = config.free_confirm_ms;
    }

    if (!candidate) {
        confirming_ = false;
        return false;
    }

    if (!confirming_) {
        confirming_ = true;
        candidate_since_ms_ = now_ms;
    }

    if (now_ms - candidate_since_ms_ < confirm_ms) {
        return false;
    }

    state_ = (state_ == OccupancyState::Free) ? OccupancyState::Occupied
                                              : OccupancyState::Free;
    confirming_ = false;
    syslog(LOG_INFO, "Spot %s at %.1f cm", occupancyLabel(state_), distance_cm);
    return true;
}
