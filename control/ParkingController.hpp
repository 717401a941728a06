#ifndef PARKINGCONTROLLER_HPP
#define PARKINGCONTROLLER_HPP

#include <cstdint>

#include "../common/Capabilities.hpp"
#include "../common/ParkingConfig.hpp"
#include "../common/Telemetry.hpp"
#include "CommandQueue.hpp"
#include "GasMonitor.hpp"
#include "GateStateMachine.hpp"
#include "LightPolicy.hpp"
#include "OccupancyTracker.hpp"
#include "SignalFilter.hpp"

/*
 * Runs one bay. Called from the control thread every CONTROL_TICK_MS:
 *   1. apply every queued command
 *   2. every SENSE_INTERVAL_MS: distance burst -> filter -> occupancy, gas, lux
 *   3. gate tick with fresh presence readings
 *   4. drive actuators (gas alarm tone beats parking assist)
 *   5. rebuild the telemetry snapshot; publish it every TELEMETRY_INTERVAL_MS
 *      and whenever the gate changes state
 * Domain state lives in the components; the controller keeps only the config
 * record, the queue handle, its cycle schedule and timeout log edges.
 */
class ParkingController {
public:
    ParkingController(const ParkingIo& io, CommandQueue& queue,
                      const ParkingConfig& config = ParkingConfig::defaults());

    void tick(uint64_t now_ms);

    const TelemetrySnapshot& snapshot() const { return snapshot_; }
    const ParkingConfig& config() const { return config_; }

    GateState gateState() const { return gate_.state(); }
    int gateAngle() const { return gate_.angle(); }
    OccupancyState occupancy() const { return occupancy_.state(); }
    GasState gasState() const { return gas_.state(); }
    bool lampOn() const { return lamp_on_; }

private:
    void applyCommands(const GateInputs& inputs, uint64_t now_ms);
    ParkStatus apply(const Command& cmd, const GateInputs& inputs, uint64_t now_ms);
    void report(const Command& cmd, ParkStatus status);
    void publishThreshold(const std::string& topic, const std::string& name);

    void sense(uint64_t now_ms);
    void noteTimeout(bool& flag, bool timed_out, const char* sensor);
    void driveOutputs(uint64_t now_ms);
    void buildSnapshot();
    void publishTelemetry();

    ParkingIo io_;
    CommandQueue& queue_;
    ParkingConfig config_;

    SignalFilter filter_;
    OccupancyTracker occupancy_;
    GasMonitor gas_;
    LightPolicy light_;
    GateStateMachine gate_;

    TelemetrySnapshot snapshot_;
    bool lamp_on_ = false;

    bool distance_timeout_ = false;
    bool gas_timeout_ = false;
    bool lux_timeout_ = false;

    bool started_ = false;
    uint64_t last_sense_ms_ = 0;
    uint64_t last_telemetry_ms_ = 0;
};

#endif // PARKINGCONTROLLER_HPP
