#include <gtest/gtest.h>

#include "../common/ParkingConfig.hpp"

TEST(ParkingConfig, DefaultsAreValid) {
    ParkingConfig config = ParkingConfig::defaults();
    EXPECT_TRUE(config.valid());
    EXPECT_LT(config.occupied_distance_cm, config.free_distance_cm);
    EXPECT_EQ(config.light_mode, LightMode::Auto);
}

TEST(ParkingConfig, AcceptsInRangeWrite) {
    ParkingConfig config;
    EXPECT_EQ(config.setThreshold("mq2_threshold", 1800), ParkStatus::Ok);
    EXPECT_EQ(config.gas_threshold, 1800);
    EXPECT_EQ(config.setThreshold("servo_interval", 20), ParkStatus::Ok);
    EXPECT_EQ(config.servo_interval_ms, 20u);
}

TEST(ParkingConfig, RejectsOutOfRangeAndKeepsValue) {
    ParkingConfig config;
    EXPECT_EQ(config.setThreshold("mq2_threshold", 5000), ParkStatus::ConfigOutOfRange);
    EXPECT_EQ(config.setThreshold("servo_step", 0), ParkStatus::ConfigOutOfRange);
    EXPECT_EQ(config.setThreshold("lux_threshold", -1), ParkStatus::ConfigOutOfRange);
    EXPECT_EQ(config.gas_threshold, 1500);
    EXPECT_EQ(config.servo_step_deg, 2);
    EXPECT_FLOAT_EQ(config.lux_threshold, 50.0f);
}

TEST(ParkingConfig, KeepsDeadBandAndHysteresisOrdering) {
    ParkingConfig config;
    EXPECT_EQ(config.setThreshold("occupied_distance", 9), ParkStatus::ConfigOutOfRange);
    EXPECT_EQ(config.setThreshold("free_distance", 3), ParkStatus::ConfigOutOfRange);
    EXPECT_EQ(config.setThreshold("mq2_hyst", 1500), ParkStatus::ConfigOutOfRange);
    EXPECT_EQ(config.setThreshold("mq2_threshold", 150), ParkStatus::ConfigOutOfRange);
    EXPECT_FLOAT_EQ(config.occupied_distance_cm, 3.0f);
    EXPECT_FLOAT_EQ(config.free_distance_cm, 9.0f);
    EXPECT_EQ(config.gas_hysteresis, 200);
}

TEST(ParkingConfig, UnknownNameIsInvalid) {
    ParkingConfig config;
    EXPECT_EQ(config.setThreshold("buzzer_volume", 3), ParkStatus::InvalidCommand);
    double value = 0;
    EXPECT_FALSE(config.threshold("buzzer_volume", value));
}

TEST(ParkingConfig, ResetKeepsLightMode) {
    ParkingConfig config;
    config.setThreshold("mq2_threshold", 900);
    config.setThreshold("lux_threshold", 10);
    config.light_mode = LightMode::Off;

    config.resetThresholds();
    EXPECT_EQ(config.gas_threshold, 1500);
    EXPECT_FLOAT_EQ(config.lux_threshold, 50.0f);
    EXPECT_EQ(config.light_mode, LightMode::Off);
}

TEST(ParkingConfig, LightModeParsing) {
    LightMode mode = LightMode::On;
    EXPECT_TRUE(parseLightMode(" auto\n", mode));
    EXPECT_EQ(mode, LightMode::Auto);
    EXPECT_TRUE(parseLightMode("OFF", mode));
    EXPECT_EQ(mode, LightMode::Off);
    EXPECT_FALSE(parseLightMode("blink", mode));
    EXPECT_EQ(mode, LightMode::Off);
}

TEST(ParkingConfig, HysteresisMustBePositive) {
    ParkingConfig config;
    EXPECT_EQ(config.setThreshold("mq2_hyst", 0), ParkStatus::ConfigOutOfRange);
    EXPECT_EQ(config.gas_hysteresis, 200);
    EXPECT_EQ(config.setThreshold("mq2_hyst", 1), ParkStatus::Ok);
    EXPECT_EQ(config.gas_hysteresis, 1);

    config.gas_hysteresis = 0;
    EXPECT_FALSE(config.valid());
}
