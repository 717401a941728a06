#include "ParkingController.hpp"

#include <algorithm>
#include <sys/syslog.h>
#include <vector>

ParkingController::ParkingController(const ParkingIo& io, CommandQueue& queue,
                                     const ParkingConfig& config)
    : io_(io), queue_(queue), config_(config) {
    if (!config_.valid()) {
        syslog(LOG_WARNING, "Invalid start-up thresholds, using compiled defaults");
        config_.resetThresholds();
    }
    buildSnapshot();
}

void ParkingController::tick(uint64_t now_ms) {
    GateState gate_before = gate_.state();
    GateInputs inputs;
    inputs.entry = io_.entry.present();
    inputs.exit = io_.exit.present();

    applyCommands(inputs, now_ms);

    // A distance burst blocks; keep it off the ticks that step the barrier
    bool first = !started_;
    if (first || (!gate_.moving() && now_ms - last_sense_ms_ >= SENSE_INTERVAL_MS)) {
        sense(now_ms);
        last_sense_ms_ = now_ms;
    }

    inputs.occupied = occupancy_.state() == OccupancyState::Occupied;
    gate_.tick(inputs, now_ms, config_);
    bool gate_changed = gate_.state() != gate_before;

    driveOutputs(now_ms);
    buildSnapshot();

    if (first || gate_changed || now_ms - last_telemetry_ms_ >= TELEMETRY_INTERVAL_MS) {
        publishTelemetry();
        last_telemetry_ms_ = now_ms;
    }
    started_ = true;
}

void ParkingController::applyCommands(const GateInputs& inputs, uint64_t now_ms) {
    for (const Command& cmd : queue_.drain()) {
        ParkStatus status = apply(cmd, inputs, now_ms);
        if (cmd.type != CommandType::ButtonPress) {
            report(cmd, status);
        }
    }
}

ParkStatus ParkingController::apply(const Command& cmd, const GateInputs& inputs, uint64_t now_ms) {
    switch (cmd.type) {
        case CommandType::OpenGate:
            return gate_.requestOpen(now_ms);

        case CommandType::CloseGate:
            return gate_.requestClose(inputs, now_ms);

        case CommandType::ButtonPress:
            gate_.pressButton(now_ms);
            return ParkStatus::Ok;

        case CommandType::SetLightMode:
            config_.light_mode = cmd.mode;
            return ParkStatus::Ok;

        case CommandType::ResetConfig:
            config_.resetThresholds();
            publishThreshold("parking/cfg/mq2_threshold", "mq2_threshold");
            publishThreshold("parking/cfg/mq2_hyst", "mq2_hyst");
            publishThreshold("parking/cfg/lux_threshold", "lux_threshold");
            return ParkStatus::Ok;

        case CommandType::SetThreshold: {
            ParkStatus status = config_.setThreshold(cmd.name, cmd.value);
            if (status == ParkStatus::Ok) {
                publishThreshold("parking/cfg/" + cmd.name + "/confirm", cmd.name);
            }
            return status;
        }
    }
    return ParkStatus::InvalidCommand;
}

void ParkingController::report(const Command& cmd, ParkStatus status) {
    std::string what = commandName(cmd.type);
    if (cmd.type == CommandType::SetThreshold) {
        what += " " + cmd.name;
    } else if (cmd.type == CommandType::SetLightMode) {
        what += " ";
        what += lightModeName(cmd.mode);
    }

    if (status == ParkStatus::Ok) {
        syslog(LOG_INFO, "Command %s accepted", what.c_str());
        io_.telemetry.publish("parking/cmd/result", "ACCEPTED " + what);
    } else {
        syslog(LOG_WARNING, "Command %s rejected: %s (gate %s)", what.c_str(),
               statusName(status), gateStateName(gate_.state()));
        io_.telemetry.publish("parking/cmd/result",
                              "REJECTED " + what + " " + statusName(status));
    }
}

void ParkingController::publishThreshold(const std::string& topic, const std::string& name) {
    double value = 0.0;
    if (config_.threshold(name, value)) {
        io_.telemetry.publish(topic, formatDecimal(static_cast<float>(value)));
    }
}

void ParkingController::sense(uint64_t now_ms) {
    std::vector<float> burst;
    io_.distance.readBurst(BURST_SIZE, burst);
    float distance = 0.0f;
    bool distance_ok = filter_.update(burst, distance) == ParkStatus::Ok;
    if (distance_ok) {
        occupancy_.update(distance, now_ms, config_);
    }
    noteTimeout(distance_timeout_, !distance_ok, "Distance");

    int raw = 0;
    bool gas_ok = io_.gas.readRaw(raw);
    if (gas_ok) {
        gas_.update(raw, now_ms, config_);
    }
    noteTimeout(gas_timeout_, !gas_ok, "Gas");

    float lux = 0.0f;
    bool lux_ok = io_.lux.readLux(lux);
    if (lux_ok) {
        light_.observe(lux);
    }
    noteTimeout(lux_timeout_, !lux_ok, "Lux");
}

// Logs timeout edges only
void ParkingController::noteTimeout(bool& flag, bool timed_out, const char* sensor) {
    if (timed_out && !flag) {
        syslog(LOG_WARNING, "%s read timed out, holding last value", sensor);
    } else if (!timed_out && flag) {
        syslog(LOG_INFO, "%s readings recovered", sensor);
    }
    flag = timed_out;
}

void ParkingController::driveOutputs(uint64_t now_ms) {
    io_.motion.setAngle(gate_.angle());
    SignalAspect aspect = gate_.signal(now_ms);
    io_.signal.setSignal(aspect.red, aspect.yellow, aspect.green);

    bool occupied = occupancy_.state() == OccupancyState::Occupied;
    io_.indicators.setSpot(occupied);

    // Gas alarm tone always wins over parking assist
    if (gas_.alarm()) {
        bool beep = ((now_ms - gas_.alarmSince()) / GAS_ALARM_BEEP_MS) % 2 == 0;
        io_.indicators.setBuzzer(beep ? GAS_ALARM_TONE_HZ : 0, beep ? BUZZER_DUTY_PERCENT : 0);
    } else {
        unsigned tone = 0;
        if (!occupied && filter_.primed()) {
            switch (classifyAssistZone(filter_.last(), config_)) {
                case AssistZone::Stop:     tone = ASSIST_STOP_TONE_HZ; break;
                case AssistZone::Slow:     tone = ASSIST_SLOW_TONE_HZ; break;
                case AssistZone::Approach: tone = ASSIST_APPROACH_TONE_HZ; break;
                case AssistZone::None:     break;
            }
        }
        io_.indicators.setBuzzer(tone, tone ? BUZZER_DUTY_PERCENT : 0);
    }

    lamp_on_ = light_.decide(config_);
    io_.indicators.setLamp(lamp_on_);
    io_.indicators.setAlarm(gas_.alarm());
}

void ParkingController::buildSnapshot() {
    TelemetrySnapshot snap;
    snap.gate = gateLabel(gate_.state());
    snap.spot = occupancyLabel(occupancy_.state());
    float distance = filter_.primed() ? filter_.last() : DISPLAY_MAX_DISTANCE;
    snap.distance_cm = std::clamp(distance, 0.0f, DISPLAY_MAX_DISTANCE);
    snap.gas_raw = gas_.lastReading();
    snap.gas_alarm = gasLabel(gas_.state());
    snap.lux = light_.lux();
    snap.gate_angle = gate_.angle();
    snap.alarm_active = gas_.alarm();
    snap.assist_active = occupancy_.state() == OccupancyState::Free && filter_.primed() &&
                         classifyAssistZone(filter_.last(), config_) != AssistZone::None;
    snapshot_ = snap;
}

void ParkingController::publishTelemetry() {
    for (const TelemetryMessage& msg : telemetryMessages(snapshot_)) {
        io_.telemetry.publish(msg.first, msg.second);
    }
    io_.display.render(snapshot_);
}
