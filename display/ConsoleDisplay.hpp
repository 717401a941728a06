#ifndef CONSOLEDISPLAY_HPP
#define CONSOLEDISPLAY_HPP

#include "../common/Capabilities.hpp"

// Status screen on stdout. Gas alarm screen first, then parking assist,
// otherwise the main screen.
class ConsoleDisplay : public DisplaySink {
public:
    void render(const TelemetrySnapshot& snapshot) override;
};

#endif // CONSOLEDISPLAY_HPP
