#ifndef GATEBUTTON_HPP
#define GATEBUTTON_HPP

#include <cstdint>

class CommandQueue;

// Push button to ground. pigpio's alert thread turns each debounced press
// into a ButtonPress command for the next control cycle.
class GateButton {
public:
    GateButton(unsigned pin, CommandQueue& queue) : pin_(pin), queue_(queue) {}
    ~GateButton();

    bool setup();

private:
    static void onAlert(int gpio, int level, uint32_t tick, void* user);

    unsigned pin_;
    CommandQueue& queue_;
    bool armed_ = false;
};

#endif // GATEBUTTON_HPP
