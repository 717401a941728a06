#include "Command.hpp"

#include <cmath>
#include <cstdlib>

namespace {

const std::string CMD_PREFIX = "parking/cmd/";
const std::string CFG_PREFIX = "parking/cfg/";
const std::string CONFIRM_SUFFIX = "/confirm";

std::string trim(const std::string& text) {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool parseNumber(const std::string& text, double& value) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return false;
    }
    value = parsed;
    return true;
}

} // namespace

const char* commandName(CommandType type) {
    switch (type) {
        case CommandType::OpenGate:     return "open_gate";
        case CommandType::CloseGate:    return "close_gate";
        case CommandType::SetLightMode: return "parking_light_mode";
        case CommandType::ResetConfig:  return "reset_config";
        case CommandType::SetThreshold: return "set_threshold";
        case CommandType::ButtonPress:  return "button";
    }
    return "unknown";
}

bool isConfirmEcho(const std::string& datagram) {
    std::string line = trim(datagram);
    return endsWith(line.substr(0, line.find(' ')), CONFIRM_SUFFIX);
}

ParkStatus parseCommand(const std::string& datagram, Command& cmd) {
    std::string line = trim(datagram);
    auto space = line.find(' ');
    std::string topic = line.substr(0, space);
    std::string payload = (space == std::string::npos) ? "" : trim(line.substr(space + 1));

    Command parsed;

    if (topic == CMD_PREFIX + "open_gate") {
        parsed.type = CommandType::OpenGate;
    } else if (topic == CMD_PREFIX + "close_gate") {
        parsed.type = CommandType::CloseGate;
    } else if (topic == CMD_PREFIX + "reset_config") {
        parsed.type = CommandType::ResetConfig;
    } else if (topic == CMD_PREFIX + "parking_light_mode") {
        parsed.type = CommandType::SetLightMode;
        if (!parseLightMode(payload, parsed.mode)) {
            return ParkStatus::InvalidCommand;
        }
    } else if (startsWith(topic, CFG_PREFIX) && !endsWith(topic, CONFIRM_SUFFIX)) {
        parsed.type = CommandType::SetThreshold;
        parsed.name = topic.substr(CFG_PREFIX.size());
        if (parsed.name.empty() || parsed.name.find('/') != std::string::npos) {
            return ParkStatus::InvalidCommand;
        }
        if (!parseNumber(payload, parsed.value)) {
            return ParkStatus::InvalidCommand;
        }
    } else {
        return ParkStatus::InvalidCommand;
    }

    cmd = parsed;
    return ParkStatus::Ok;
}
