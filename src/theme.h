#ifndef ACLOCK_THEME_H
#define ACLOCK_THEME_H

#include <cstdint>

namespace aclock {

struct Rgb {
    uint8_t r, g, b;
};

struct Rgba {
    uint8_t r, g, b, a;
};

inline bool operator==(const Rgb& x, const Rgb& y) {
    return x.r == y.r && x.g == y.g && x.b == y.b;
}

inline bool operator==(const Rgba& x, const Rgba& y) {
    return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}

inline Rgba opaque(const Rgb& c) {
    return Rgba{ c.r, c.g, c.b, 255 };
}

enum class ThemeKind { Light, Dark };

struct Theme {
    Rgb background;
    Rgb faceOuter;
    Rgb faceMiddle;
    Rgb faceInner;
    Rgb handHour;
    Rgb handMinute;
    Rgb handSecond;
    Rgb mark;
    Rgba shadow;
    Rgb text;
};

// Dark from 18:00 until 05:59, light otherwise.
ThemeKind selectTheme(int hour);

const Theme& themeFor(ThemeKind kind);

const char* themeName(ThemeKind kind);

} // namespace aclock

#endif
