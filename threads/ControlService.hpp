#ifndef CONTROLSERVICE_HPP
#define CONTROLSERVICE_HPP

#include <atomic>
#include <csignal>

class ParkingController;

#define CONTROL_TIMER_SIGNAL SIGRTMIN

struct ControlServiceArgs {
    ParkingController* controller;
    std::atomic<bool>* running;
};

// Drives ParkingController::tick() every CONTROL_TICK_MS from a POSIX timer.
// CONTROL_TIMER_SIGNAL must be blocked in every thread before this starts.
void* ControlServiceThread(void* arg);

#endif // CONTROLSERVICE_HPP
