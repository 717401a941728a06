#include <gtest/gtest.h>

#include "../control/CommandQueue.hpp"

TEST(CommandParse, GateCommands) {
    Command cmd;
    ASSERT_EQ(parseCommand("parking/cmd/open_gate", cmd), ParkStatus::Ok);
    EXPECT_EQ(cmd.type, CommandType::OpenGate);
    ASSERT_EQ(parseCommand("parking/cmd/close_gate\n", cmd), ParkStatus::Ok);
    EXPECT_EQ(cmd.type, CommandType::CloseGate);
    ASSERT_EQ(parseCommand("parking/cmd/reset_config", cmd), ParkStatus::Ok);
    EXPECT_EQ(cmd.type, CommandType::ResetConfig);
}

TEST(CommandParse, LightMode) {
    Command cmd;
    ASSERT_EQ(parseCommand("parking/cmd/parking_light_mode  on ", cmd), ParkStatus::Ok);
    EXPECT_EQ(cmd.type, CommandType::SetLightMode);
    EXPECT_EQ(cmd.mode, LightMode::On);
    EXPECT_EQ(parseCommand("parking/cmd/parking_light_mode DIM", cmd), ParkStatus::InvalidCommand);
    EXPECT_EQ(parseCommand("parking/cmd/parking_light_mode", cmd), ParkStatus::InvalidCommand);
}

TEST(CommandParse, Threshold) {
    Command cmd;
    ASSERT_EQ(parseCommand("parking/cfg/mq2_threshold 1800", cmd), ParkStatus::Ok);
    EXPECT_EQ(cmd.type, CommandType::SetThreshold);
    EXPECT_EQ(cmd.name, "mq2_threshold");
    EXPECT_DOUBLE_EQ(cmd.value, 1800.0);

    EXPECT_EQ(parseCommand("parking/cfg/mq2_threshold high", cmd), ParkStatus::InvalidCommand);
    EXPECT_EQ(parseCommand("parking/cfg/mq2_threshold", cmd), ParkStatus::InvalidCommand);
    EXPECT_EQ(parseCommand("parking/cfg/lux_threshold nan", cmd), ParkStatus::InvalidCommand);
    EXPECT_EQ(parseCommand("parking/cfg/ 10", cmd), ParkStatus::InvalidCommand);
}

TEST(CommandParse, UnknownTopicRejected) {
    Command cmd;
    cmd.type = CommandType::ResetConfig;
    EXPECT_EQ(parseCommand("parking/cmd/self_destruct", cmd), ParkStatus::InvalidCommand);
    EXPECT_EQ(parseCommand("", cmd), ParkStatus::InvalidCommand);
    EXPECT_EQ(cmd.type, CommandType::ResetConfig);
}

TEST(CommandParse, ConfirmEchoes) {
    EXPECT_TRUE(isConfirmEcho("parking/cfg/mq2_threshold/confirm 1800"));
    EXPECT_FALSE(isConfirmEcho("parking/cfg/mq2_threshold 1800"));
    Command cmd;
    EXPECT_EQ(parseCommand("parking/cfg/mq2_threshold/confirm 1800", cmd), ParkStatus::InvalidCommand);
}

TEST(CommandQueue, DrainsInOrder) {
    CommandQueue queue(4);
    Command open;
    open.type = CommandType::OpenGate;
    Command close;
    close.type = CommandType::CloseGate;
    queue.push(open);
    queue.push(close);

    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 2u);
    EXPECT_EQ(drained[0].type, CommandType::OpenGate);
    EXPECT_EQ(drained[1].type, CommandType::CloseGate);
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_TRUE(queue.drain().empty());
}

TEST(CommandQueue, OverflowDropsOldest) {
    CommandQueue queue(3);
    for (int i = 0; i < 5; ++i) {
        Command cmd;
        cmd.type = CommandType::SetThreshold;
        cmd.name = "lux_threshold";
        cmd.value = i;
        EXPECT_EQ(queue.push(cmd), i < 3);
    }
    EXPECT_EQ(queue.dropped(), 2u);

    auto drained = queue.drain();
    ASSERT_EQ(drained.size(), 3u);
    EXPECT_DOUBLE_EQ(drained.front().value, 2.0);
    EXPECT_DOUBLE_EQ(drained.back().value, 4.0);
}
