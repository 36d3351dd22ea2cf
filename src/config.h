#ifndef ACLOCK_CONFIG_H
#define ACLOCK_CONFIG_H

#include <string>

namespace aclock {

struct ClockGeometry {
    int centerX = 300;
    int centerY = 300;
    int radius = 250;
    int infoY = 50;         // vertical center of the info panel
    int shadowOffset = 5;
};

struct AppConfig {
    std::string title = "Analog Clock";
    int windowWidth = 600;
    int windowHeight = 600;
    ClockGeometry geometry;
    std::string weatherUrl = "https://wttr.in/?format=%t+%C";
    long weatherTimeoutSec = 10;
    int framesPerSecond = 60;
};

} // namespace aclock

#endif
