#include "ConsoleDisplay.hpp"
#include "../common/Telemetry.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

void ConsoleDisplay::render(const TelemetrySnapshot& snapshot) {
    auto now = std::chrono::system_clock::now();
    std::time_t now_time = std::chrono::system_clock::to_time_t(now);
    std::cout << "[" << std::put_time(std::localtime(&now_time), "%H:%M:%S") << "] ";

    if (snapshot.alarm_active) {
        std::cout << "[ALERT] GAS " << snapshot.gas_raw << " - evacuate bay\n";
    } else if (snapshot.assist_active) {
        std::cout << "[ASSIST] " << formatDecimal(snapshot.distance_cm) << " cm\n";
    } else {
        std::cout << "Gate: " << snapshot.gate << " (" << snapshot.gate_angle << " deg)"
                  << " | Spot: " << snapshot.spot
                  << " | Gas: " << snapshot.gas_raw << " " << snapshot.gas_alarm
                  << " | Lux: " << formatDecimal(snapshot.lux) << "\n";
    }
}
