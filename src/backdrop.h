#ifndef ACLOCK_BACKDROP_H
#define ACLOCK_BACKDROP_H

#include <vector>

#include "theme.h"

namespace aclock {

// Source-over composite of a translucent color onto an opaque one.
Rgb blendOver(const Rgba& color, const Rgb& backdrop);

// Opaque shapes drawn so far in the current frame, for surfaces that
// cannot composite and have to pick a solid color for translucent lines.
class Backdrop {
public:
    // Starts a new frame painted entirely in color.
    void reset(const Rgb& color);
    void addCircle(double cx, double cy, double radius, const Rgb& color);

    // Color of the topmost shape covering (x, y).
    Rgb colorAt(double x, double y) const;

private:
    struct Circle {
        double cx, cy, radius;
        Rgb color;
    };

    Rgb base_ = Rgb{ 0, 0, 0 };
    std::vector<Circle> circles_;
};

} // namespace aclock

#endif
