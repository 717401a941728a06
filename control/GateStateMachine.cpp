#include "GateStateMachine.hpp"

#include <algorithm>
#include <sys/syslog.h>

const char* gateLabel(GateState state) {
    switch (state) {
        case GateState::Idle:       return "CHIUSA";
        case GateState::Green:      return "PRONTA";
        case GateState::Opening:    return "APERTURA";
        case GateState::WaitClear:  return "APERTA (AUTO)";
        case GateState::Closing:    return "CHIUSURA";
        case GateState::ManualOpen: return "APERTA (MAN)";
    }
    return "UNKNOWN";
}

const char* gateStateName(GateState state) {
    switch (state) {
        case GateState::Idle:       return "IDLE";
        case GateState::Green:      return "GREEN";
        case GateState::Opening:    return "OPENING";
        case GateState::WaitClear:  return "WAIT_CLEAR";
        case GateState::Closing:    return "CLOSING";
        case GateState::ManualOpen: return "MANUAL_OPEN";
    }
    return "UNKNOWN";
}

void GateStateMachine::enter(GateState next, uint64_t now_ms) {
    if (next == state_) {
        return;
    }
    syslog(LOG_INFO, "Gate %s -> %s (angle %d)", gateStateName(state_), gateStateName(next), angle_);
    state_ = next;
    blink_since_ms_ = now_ms;
    clear_timing_ = false;
}

void GateStateMachine::startOpening(bool manual, uint64_t now_ms) {
    manual_ = manual;
    target_angle_ = GATE_OPEN_ANGLE;
    last_step_ms_ = now_ms;
    enter(GateState::Opening, now_ms);
}

void GateStateMachine::startClosing(uint64_t now_ms) {
    manual_ = false;
    target_angle_ = GATE_CLOSED_ANGLE;
    last_step_ms_ = now_ms;
    enter(GateState::Closing, now_ms);
}

bool GateStateMachine::stepDue(uint64_t now_ms, const ParkingConfig& config) const {
    return now_ms - last_step_ms_ >= config.servo_interval_ms;
}

ParkStatus GateStateMachine::requestOpen(uint64_t now_ms) {
    if (state_ == GateState::Opening || state_ == GateState::ManualOpen) {
        return ParkStatus::InvalidCommand;
    }
    startOpening(state_ != GateState::Green, now_ms);
    return ParkStatus::Ok;
}

ParkStatus GateStateMachine::requestClose(const GateInputs& inputs, uint64_t now_ms) {
    if (state_ != GateState::WaitClear && state_ != GateState::ManualOpen) {
        return ParkStatus::InvalidCommand;
    }
    if (inputs.obstacle()) {
        return ParkStatus::UnsafeOperation;
    }
    startClosing(now_ms);
    return ParkStatus::Ok;
}

bool GateStateMachine::pressButton(uint64_t now_ms) {
    if (state_ != GateState::Green) {
        return false;
    }
    startOpening(false, now_ms);
    return true;
}

bool GateStateMachine::tick(const GateInputs& inputs, uint64_t now_ms, const ParkingConfig& config) {
    GateState before = state_;

    switch (state_) {
        case GateState::Idle:
            // Exit is always allowed, even with the bay full
            if (inputs.exit) {
                startOpening(false, now_ms);
            } else if (!inputs.occupied && inputs.entry) {
                enter(GateState::Green, now_ms);
            }
            break;

        case GateState::Green:
            if (inputs.exit) {
                startOpening(false, now_ms);
            } else if (inputs.occupied || !inputs.entry) {
                enter(GateState::Idle, now_ms);
            }
            break;

        case GateState::Opening:
            if (stepDue(now_ms, config)) {
                angle_ = std::min(angle_ + config.servo_step_deg, target_angle_);
                last_step_ms_ = now_ms;
                if (angle_ == target_angle_) {
                    enter(manual_ ? GateState::ManualOpen : GateState::WaitClear, now_ms);
                }
            }
            break;

        case GateState::WaitClear:
            if (inputs.obstacle()) {
                clear_timing_ = false;
                break;
            }
            if (!clear_timing_) {
                clear_timing_ = true;
                clear_since_ms_ = now_ms;
            }
            if (now_ms - clear_since_ms_ >= SETTLE_DELAY_MS) {
                startClosing(now_ms);
            }
            break;

        case GateState::Closing:
            // Re-checked every tick, not only on entry
            if (inputs.obstacle()) {
                manual_ = false;
                target_angle_ = GATE_OPEN_ANGLE;
                enter(GateState::Opening, now_ms);
                break;
            }
            if (stepDue(now_ms, config)) {
                angle_ = std::max(angle_ - config.servo_step_deg, target_angle_);
                last_step_ms_ = now_ms;
                if (angle_ == target_angle_) {
                    enter(GateState::Idle, now_ms);
                }
            }
            break;

        case GateState::ManualOpen:
            break;
    }

    return state_ != before;
}

SignalAspect GateStateMachine::signal(uint64_t now_ms) const {
    SignalAspect aspect;
    switch (state_) {
        case GateState::Idle:
            aspect.red = true;
            break;
        case GateState::Green:
            aspect.green = true;
            break;
        case GateState::Opening:
        case GateState::Closing:
            aspect.yellow = ((now_ms - blink_since_ms_) / BLINK_INTERVAL_MS) % 2 == 0;
            break;
        case GateState::WaitClear:
        case GateState::ManualOpen:
            break;
    }
    return aspect;
}
