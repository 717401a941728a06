#ifndef OCCUPANCYTRACKER_HPP
#define OCCUPANCYTRACKER_HPP

#include <cstdint>

#include "../common/ParkingConfig.hpp"

enum class OccupancyState { Free, Occupied };

// Parking-assist feedback band, closest first
enum class AssistZone { Stop, Slow, Approach, None };

const char* occupancyLabel(OccupancyState state);
const char* assistZoneName(AssistZone zone);

AssistZone classifyAssistZone(float distance_cm, const ParkingConfig& config);

// Debounced FREE/OCCUPIED over the filtered distance.
// Entering OCCUPIED needs distance <= occupied threshold for occupied_confirm_ms,
// leaving it needs distance > free threshold for free_confirm_ms. Anything in
// between breaks continuity and restarts the candidate timer.
class OccupancyTracker {
public:
    // Returns true when the confirmed state changed on this reading
    bool update(float distance_cm, uint64_t now_ms, const ParkingConfig& config);

    OccupancyState state() const { return state_; }
    bool confirming() const { return confirming_; }

private:
    OccupancyState state_ = OccupancyState::Free;
    bool confirming_ = false;
    uint64_t candidate_since_ms_ = 0;
};

#endif // OCCUPANCYTRACKER_HPP
