#ifndef COMMAND_HPP
#define COMMAND_HPP

#include <string>

#include "../common/ParkStatus.hpp"
#include "../common/ParkingConfig.hpp"

enum class CommandType {
    OpenGate,
    CloseGate,
    SetLightMode,
    ResetConfig,
    SetThreshold,
    ButtonPress,
};

// A queued instruction, applied once at the next cycle boundary
struct Command {
    CommandType type = CommandType::OpenGate;
    LightMode mode = LightMode::Auto;  // SetLightMode
    std::string name;                  // SetThreshold
    double value = 0.0;                // SetThreshold
};

const char* commandName(CommandType type);

// Our own config echoes, never treated as input
bool isConfirmEcho(const std::string& datagram);

/*
 * Parses one "<topic> [payload]" datagram:
 *   parking/cmd/open_gate
 *   parking/cmd/close_gate
 *   parking/cmd/parking_light_mode AUTO|ON|OFF
 *   parking/cmd/reset_config
 *   parking/cfg/<name> <number>
 * Unknown topics and bad payloads give InvalidCommand. Range checks on
 * threshold values happen when the command is applied.
 */
ParkStatus parseCommand(const std::string& datagram, Command& cmd);

#endif // COMMAND_HPP
