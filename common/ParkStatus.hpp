#ifndef PARKSTATUS_HPP
#define PARKSTATUS_HPP

// Outcome of every fallible operation in the controller.
// Nothing here is fatal: callers hold the last good value or reject and go on.
enum class ParkStatus {
    Ok,
    SensorTimeout,     // driver returned no reading or a partial burst
    InvalidCommand,    // malformed payload or guard not satisfied
    UnsafeOperation,   // close requested while an obstacle is present
    ConfigOutOfRange,  // threshold write outside validated bounds
};

inline const char* statusName(ParkStatus status) {
    switch (status) {
        case ParkStatus::Ok:               return "OK";
        case ParkStatus::SensorTimeout:    return "SENSOR_TIMEOUT";
        case ParkStatus::InvalidCommand:   return "INVALID_COMMAND";
        case ParkStatus::UnsafeOperation:  return "UNSAFE_OPERATION";
        case ParkStatus::ConfigOutOfRange: return "CONFIG_OUT_OF_RANGE";
    }
    return "UNKNOWN";
}

#endif // PARKSTATUS_HPP
