#ifndef ACLOCK_SURFACE_H
#define ACLOCK_SURFACE_H

#include <string>

#include "theme.h"

namespace aclock {

// Drawing target for one frame. Coordinates are window pixels, y down.
class Surface {
public:
    virtual ~Surface() {}

    virtual void fill(const Rgb& color) = 0;
    // UTF-8 text centered on (centerX, centerY).
    virtual void drawText(int centerX, int centerY, const std::string& text, const Rgb& color) = 0;
    virtual void fillCircle(int cx, int cy, int radius, const Rgb& color) = 0;
    virtual void drawLine(double x1, double y1, double x2, double y2, int width, const Rgba& color) = 0;
};

} // namespace aclock

#endif
