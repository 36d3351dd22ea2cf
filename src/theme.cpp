#include "theme.h"

namespace aclock {

namespace {

const Theme LIGHT_THEME = {
    { 225, 239, 240 },  // background
    { 45, 45, 45 },     // face outer
    { 229, 229, 229 },  // face middle
    { 255, 255, 255 },  // face inner
    { 45, 45, 45 },     // hour hand
    { 45, 45, 45 },     // minute hand
    { 255, 0, 0 },      // second hand
    { 45, 45, 45 },     // marks
    { 0, 0, 0, 50 },    // shadow
    { 0, 0, 0 }         // text
};

const Theme DARK_THEME = {
    { 30, 30, 30 },
    { 100, 100, 100 },
    { 70, 70, 70 },
    { 50, 50, 50 },
    { 255, 255, 255 },
    { 200, 200, 200 },
    { 255, 69, 0 },
    { 255, 255, 255 },
    { 0, 0, 0, 80 },
    { 255, 255, 255 }
};

} // namespace

ThemeKind selectTheme(int hour) {
    if (hour >= 18 || hour < 6) return ThemeKind::Dark;
    return ThemeKind::Light;
}

const Theme& themeFor(ThemeKind kind) {
    return kind == ThemeKind::Dark ? DARK_THEME : LIGHT_THEME;
}

const char* themeName(ThemeKind kind) {
    return kind == ThemeKind::Dark ? "dark" : "light";
}

} // namespace aclock
