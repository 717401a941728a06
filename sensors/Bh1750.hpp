#ifndef BH1750_HPP
#define BH1750_HPP

#include "../common/Capabilities.hpp"

// Ambient light sensor in continuous high-resolution mode
class Bh1750 : public LuxSource {
public:
    Bh1750(unsigned bus, unsigned address) : bus_(bus), address_(address) {}
    ~Bh1750() override;

    bool init();
    bool readLux(float& lux) override;

private:
    unsigned bus_;
    unsigned address_;
    int handle_ = -1;
};

#endif // BH1750_HPP
