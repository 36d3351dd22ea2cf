#include "backdrop.h"

#include <cmath>

using namespace std;

namespace aclock {

Rgb blendOver(const Rgba& color, const Rgb& backdrop) {
    double a = color.a / 255.0;
    Rgb out;
    out.r = static_cast<uint8_t>(lround(backdrop.r * (1 - a) + color.r * a));
    out.g = static_cast<uint8_t>(lround(backdrop.g * (1 - a) + color.g * a));
    out.b = static_cast<uint8_t>(lround(backdrop.b * (1 - a) + color.b * a));
    return out;
}

void Backdrop::reset(const Rgb& color) {
    base_ = color;
    circles_.clear();
}

void Backdrop::addCircle(double cx, double cy, double radius, const Rgb& color) {
    circles_.push_back(Circle{ cx, cy, radius, color });
}

Rgb Backdrop::colorAt(double x, double y) const {
    for (auto it = circles_.rbegin(); it != circles_.rend(); ++it) {
        double dx = x - it->cx;
        double dy = y - it->cy;
        if (dx * dx + dy * dy <= it->radius * it->radius) return it->color;
    }
    return base_;
}

} // namespace aclock
