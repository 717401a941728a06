#ifndef GATESTATEMACHINE_HPP
#define GATESTATEMACHINE_HPP

#include <cstdint>

#include "../common/ParkStatus.hpp"
#include "../common/ParkingConfig.hpp"

enum class GateState { Idle, Green, Opening, WaitClear, Closing, ManualOpen };

// Operator-facing label published as telemetry
const char* gateLabel(GateState state);
const char* gateStateName(GateState state);

// Presence and occupancy as seen at the start of a tick
struct GateInputs {
    bool entry = false;
    bool exit = false;
    bool occupied = false;

    bool obstacle() const { return entry || exit; }
};

struct SignalAspect {
    bool red = false;
    bool yellow = false;
    bool green = false;
};

/*
 * Barrier controller. Single instance, single writer (the control loop).
 *
 * The barrier moves servo_step_deg every servo_interval_ms while OPENING or
 * CLOSING and only leaves those states on reaching the exact target angle.
 * Exit presence opens a closed or closing barrier from any state, and any
 * presence in the gate zone reverses CLOSING on the tick it is seen.
 */
class GateStateMachine {
public:
    // Remote open. From GREEN it is the entry trigger (auto close after),
    // otherwise an operator hold-open ending in MANUAL_OPEN.
    ParkStatus requestOpen(uint64_t now_ms);
    // Remote close, only from WAIT_CLEAR or MANUAL_OPEN with the gate zone clear
    ParkStatus requestClose(const GateInputs& inputs, uint64_t now_ms);
    // Debounced push button; opens only from GREEN
    bool pressButton(uint64_t now_ms);

    // Returns true when the state changed
    bool tick(const GateInputs& inputs, uint64_t now_ms, const ParkingConfig& config);

    GateState state() const { return state_; }
    int angle() const { return angle_; }
    bool moving() const {
        return (state_ == GateState::Opening || state_ == GateState::Closing) &&
               angle_ != target_angle_;
    }
    SignalAspect signal(uint64_t now_ms) const;

private:
    void enter(GateState next, uint64_t now_ms);
    void startOpening(bool manual, uint64_t now_ms);
    void startClosing(uint64_t now_ms);
    bool stepDue(uint64_t now_ms, const ParkingConfig& config) const;

    GateState state_ = GateState::Idle;
    int angle_ = GATE_CLOSED_ANGLE;
    int target_angle_ = GATE_CLOSED_ANGLE;
    bool manual_ = false;

    uint64_t last_step_ms_ = 0;
    uint64_t blink_since_ms_ = 0;

    bool clear_timing_ = false;
    uint64_t clear_since_ms_ = 0;
};

#endif // GATESTATEMACHINE_HPP
