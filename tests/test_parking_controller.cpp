#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../control/ParkingController.hpp"
#include "FakeIo.hpp"

namespace {

Command makeCommand(CommandType type) {
    Command cmd;
    cmd.type = type;
    return cmd;
}

Command makeThreshold(const std::string& name, double value) {
    Command cmd;
    cmd.type = CommandType::SetThreshold;
    cmd.name = name;
    cmd.value = value;
    return cmd;
}

Command makeLightMode(LightMode mode) {
    Command cmd;
    cmd.type = CommandType::SetLightMode;
    cmd.mode = mode;
    return cmd;
}

std::vector<std::string> collapse(const std::vector<std::string>& labels) {
    std::vector<std::string> out;
    for (const auto& label : labels) {
        if (out.empty() || out.back() != label) {
            out.push_back(label);
        }
    }
    return out;
}

} // namespace

class ParkingControllerTest : public ::testing::Test {
protected:
    // Ticks every control period from `from` to `to` inclusive
    void run(uint64_t from, uint64_t to) {
        for (uint64_t t = from; t <= to; t += CONTROL_TICK_MS) {
            controller.tick(t);
        }
    }

    FakeBay bay;
    CommandQueue queue;
    ParkingController controller{bay.io(), queue};
};

TEST_F(ParkingControllerTest, FirstTickPublishesSnapshot) {
    controller.tick(0);

    EXPECT_EQ(bay.telemetry.payloads("parking/state/gate"), std::vector<std::string>{"CHIUSA"});
    EXPECT_EQ(bay.telemetry.payloads("parking/state/spot"), std::vector<std::string>{"LIBERO"});
    // 50 cm is capped for the dashboard
    EXPECT_EQ(bay.telemetry.payloads("parking/ultrasonic/distance"), std::vector<std::string>{"8.0"});
    EXPECT_EQ(bay.telemetry.payloads("parking/sensors/gas"), std::vector<std::string>{"100"});
    EXPECT_EQ(bay.telemetry.payloads("parking/alarms/gas"), std::vector<std::string>{"OK"});
    EXPECT_EQ(bay.telemetry.payloads("parking/env/light"), std::vector<std::string>{"200.0"});
    EXPECT_EQ(bay.display.renders, 1);

    EXPECT_TRUE(bay.signal.red);
    EXPECT_EQ(bay.motion.angle, 0);
    EXPECT_FALSE(bay.indicators.spot_occupied);
    EXPECT_EQ(bay.indicators.buzzer_hz, 0u);
}

TEST_F(ParkingControllerTest, RemoteOpenFromGreenRunsFullCycle) {
    bay.entry.value = true;
    controller.tick(0);
    ASSERT_EQ(controller.gateState(), GateState::Green);

    queue.push(makeCommand(CommandType::OpenGate));
    controller.tick(30);
    EXPECT_EQ(controller.gateState(), GateState::Opening);
    bay.entry.value = false;

    std::vector<std::string> labels{controller.snapshot().gate};
    uint64_t wait_clear_at = 0, closing_at = 0, idle_at = 0;
    for (uint64_t t = 60; t <= 5000; t += CONTROL_TICK_MS) {
        GateState before = controller.gateState();
        controller.tick(t);
        labels.push_back(controller.snapshot().gate);
        if (before != controller.gateState()) {
            if (controller.gateState() == GateState::WaitClear) wait_clear_at = t;
            if (controller.gateState() == GateState::Closing) closing_at = t;
            if (controller.gateState() == GateState::Idle) idle_at = t;
        }
    }

    EXPECT_EQ(collapse(labels),
              (std::vector<std::string>{"APERTURA", "APERTA (AUTO)", "CHIUSURA", "CHIUSA"}));

    // 45 steps of 2 deg every 30 ms, then 1 s clear settle
    EXPECT_EQ(wait_clear_at, 30u + 45 * 30);
    EXPECT_EQ(closing_at, wait_clear_at + 30 + SETTLE_DELAY_MS);
    EXPECT_EQ(idle_at, closing_at + 45 * 30);
    EXPECT_EQ(bay.motion.angle, 0);

    EXPECT_EQ(collapse(bay.telemetry.payloads("parking/state/gate")),
              (std::vector<std::string>{"PRONTA", "APERTURA", "APERTA (AUTO)", "CHIUSURA", "CHIUSA"}));
    EXPECT_EQ(bay.telemetry.payloads("parking/cmd/result"),
              std::vector<std::string>{"ACCEPTED open_gate"});
}

TEST_F(ParkingControllerTest, ButtonPressOpensFromGreen) {
    bay.entry.value = true;
    controller.tick(0);
    queue.push(makeCommand(CommandType::ButtonPress));
    controller.tick(30);
    EXPECT_EQ(controller.gateState(), GateState::Opening);
    EXPECT_TRUE(bay.telemetry.payloads("parking/cmd/result").empty());
}

TEST_F(ParkingControllerTest, FullBayBlocksEntryButNotExit) {
    bay.distance.setAll(2.0f);
    for (uint64_t t = 0; t <= 3000; t += SENSE_INTERVAL_MS) {
        controller.tick(t);
    }
    ASSERT_EQ(controller.occupancy(), OccupancyState::Occupied);
    EXPECT_TRUE(bay.indicators.spot_occupied);
    EXPECT_EQ(controller.snapshot().spot, "OCCUPATO");
    EXPECT_EQ(bay.indicators.buzzer_hz, 0u);

    bay.entry.value = true;
    controller.tick(3030);
    EXPECT_EQ(controller.gateState(), GateState::Idle);
    EXPECT_TRUE(bay.signal.red);

    bay.exit.value = true;
    controller.tick(3060);
    EXPECT_EQ(controller.gateState(), GateState::Opening);
}

TEST_F(ParkingControllerTest, AssistToneFollowsDistance) {
    bay.distance.setAll(5.0f);
    controller.tick(0);
    EXPECT_EQ(bay.indicators.buzzer_hz, ASSIST_APPROACH_TONE_HZ);
    EXPECT_TRUE(controller.snapshot().assist_active);

    bay.distance.setAll(1.0f);
    controller.tick(200);
    controller.tick(400);
    controller.tick(600);
    EXPECT_EQ(bay.indicators.buzzer_hz, ASSIST_STOP_TONE_HZ);
    EXPECT_EQ(bay.indicators.buzzer_duty, BUZZER_DUTY_PERCENT);
}

TEST_F(ParkingControllerTest, GasAlarmOverridesAssistTone) {
    bay.distance.setAll(2.0f);
    bay.gas.raw = 2000;
    controller.tick(0);
    EXPECT_EQ(controller.gasState(), GasState::Alarm);
    EXPECT_EQ(bay.indicators.buzzer_hz, GAS_ALARM_TONE_HZ);
    EXPECT_TRUE(bay.indicators.alarm);
    EXPECT_EQ(controller.snapshot().gas_alarm, "ALLARME!");

    // Silent half of the beep, never the assist tone
    controller.tick(GAS_ALARM_BEEP_MS);
    EXPECT_EQ(bay.indicators.buzzer_hz, 0u);
    controller.tick(2 * GAS_ALARM_BEEP_MS);
    EXPECT_EQ(bay.indicators.buzzer_hz, GAS_ALARM_TONE_HZ);

    bay.gas.raw = 1300;
    controller.tick(800);
    EXPECT_EQ(controller.gasState(), GasState::Ok);
    EXPECT_FALSE(bay.indicators.alarm);
    EXPECT_EQ(bay.indicators.buzzer_hz, ASSIST_STOP_TONE_HZ);
}

TEST_F(ParkingControllerTest, SensorTimeoutsHoldLastValues) {
    bay.distance.setAll(5.0f);
    bay.gas.raw = 700;
    controller.tick(0);
    ASSERT_FLOAT_EQ(controller.snapshot().distance_cm, 5.0f);

    bay.distance.burst = {4.0f, 4.0f};
    bay.gas.ok = false;
    bay.lux.ok = false;
    controller.tick(200);

    EXPECT_FLOAT_EQ(controller.snapshot().distance_cm, 5.0f);
    EXPECT_EQ(controller.snapshot().gas_raw, 700);
    EXPECT_FLOAT_EQ(controller.snapshot().lux, 200.0f);
    EXPECT_EQ(controller.occupancy(), OccupancyState::Free);
}

TEST_F(ParkingControllerTest, ManualCloseRejectedWhileObstructed) {
    controller.tick(0);
    queue.push(makeCommand(CommandType::OpenGate));
    run(30, 30 + 45 * 30);
    ASSERT_EQ(controller.gateState(), GateState::ManualOpen);

    bay.entry.value = true;
    queue.push(makeCommand(CommandType::CloseGate));
    controller.tick(1410);
    EXPECT_EQ(controller.gateState(), GateState::ManualOpen);
    EXPECT_EQ(controller.gateAngle(), GATE_OPEN_ANGLE);

    bay.entry.value = false;
    queue.push(makeCommand(CommandType::CloseGate));
    controller.tick(1440);
    EXPECT_EQ(controller.gateState(), GateState::Closing);

    EXPECT_EQ(bay.telemetry.payloads("parking/cmd/result"),
              (std::vector<std::string>{"ACCEPTED open_gate",
                                        "REJECTED close_gate UNSAFE_OPERATION",
                                        "ACCEPTED close_gate"}));
}

TEST_F(ParkingControllerTest, DistanceNotPolledWhileBarrierMoves) {
    controller.tick(0);
    ASSERT_EQ(bay.distance.bursts, 1);

    queue.push(makeCommand(CommandType::OpenGate));
    run(30, 30 + 45 * 30);
    ASSERT_EQ(controller.gateState(), GateState::ManualOpen);
    EXPECT_EQ(bay.distance.bursts, 1);

    controller.tick(1410);
    EXPECT_EQ(bay.distance.bursts, 2);
}

TEST_F(ParkingControllerTest, CloseDuringOpeningIsDiscarded) {
    controller.tick(0);
    queue.push(makeCommand(CommandType::OpenGate));
    queue.push(makeCommand(CommandType::CloseGate));
    controller.tick(30);
    EXPECT_EQ(controller.gateState(), GateState::Opening);
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ(bay.telemetry.payloads("parking/cmd/result").back(),
              "REJECTED close_gate INVALID_COMMAND");
}

TEST_F(ParkingControllerTest, ThresholdWritesAreValidated) {
    controller.tick(0);
    queue.push(makeThreshold("mq2_threshold", 5000));
    controller.tick(30);
    EXPECT_EQ(controller.config().gas_threshold, 1500);
    EXPECT_EQ(bay.telemetry.payloads("parking/cmd/result").back(),
              "REJECTED set_threshold mq2_threshold CONFIG_OUT_OF_RANGE");

    queue.push(makeThreshold("mq2_threshold", 1200));
    controller.tick(60);
    EXPECT_EQ(controller.config().gas_threshold, 1200);
    EXPECT_EQ(bay.telemetry.payloads("parking/cfg/mq2_threshold/confirm"),
              std::vector<std::string>{"1200.0"});

    bay.gas.raw = 1250;
    controller.tick(200);
    EXPECT_EQ(controller.gasState(), GasState::Alarm);
}

TEST_F(ParkingControllerTest, ResetRestoresDefaultsAndAnnounces) {
    controller.tick(0);
    queue.push(makeThreshold("lux_threshold", 5));
    queue.push(makeLightMode(LightMode::On));
    queue.push(makeCommand(CommandType::ResetConfig));
    controller.tick(30);

    EXPECT_FLOAT_EQ(controller.config().lux_threshold, 50.0f);
    EXPECT_EQ(controller.config().light_mode, LightMode::On);
    EXPECT_EQ(bay.telemetry.payloads("parking/cfg/lux_threshold"), std::vector<std::string>{"50.0"});
    EXPECT_EQ(bay.telemetry.payloads("parking/cfg/mq2_threshold"), std::vector<std::string>{"1500.0"});
    EXPECT_EQ(bay.telemetry.payloads("parking/cfg/mq2_hyst"), std::vector<std::string>{"200.0"});
}

TEST_F(ParkingControllerTest, LightModeCommands) {
    bay.lux.lux = 10.0f;
    controller.tick(0);
    EXPECT_TRUE(bay.indicators.lamp);

    queue.push(makeLightMode(LightMode::Off));
    controller.tick(30);
    EXPECT_FALSE(bay.indicators.lamp);

    bay.lux.lux = 500.0f;
    queue.push(makeLightMode(LightMode::On));
    controller.tick(200);
    EXPECT_TRUE(bay.indicators.lamp);

    queue.push(makeLightMode(LightMode::Auto));
    controller.tick(230);
    EXPECT_FALSE(controller.lampOn());
}

TEST_F(ParkingControllerTest, PeriodicTelemetry) {
    run(0, 4050);
    // First tick, then every 2 s
    EXPECT_EQ(bay.telemetry.payloads("parking/state/gate").size(), 3u);
    EXPECT_EQ(bay.display.renders, 3);
}
