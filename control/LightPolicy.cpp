#include "LightPolicy.hpp"

bool lampOn(LightMode mode, float lux, float lux_threshold) {
    switch (mode) {
        case LightMode::On:   return true;
        case LightMode::Off:  return false;
        case LightMode::Auto: return lux < lux_threshold;
    }
    return false;
}
