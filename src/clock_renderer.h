#ifndef ACLOCK_CLOCK_RENDERER_H
#define ACLOCK_CLOCK_RENDERER_H

#include <string>

#include "clock_state.h"
#include "config.h"
#include "surface.h"
#include "theme.h"
#include "weather.h"

namespace aclock {

class ClockRenderer {
public:
    ClockRenderer(const ClockGeometry& geometry, const std::string& weatherUrl);

    // Recompute angles and date from the system clock.
    void update();
    void update(const LocalTime& now);

    // Blocking. Stores the trimmed body on success, the fallback text otherwise.
    WeatherResult refreshWeather(HttpClient& client);

    void draw(Surface& surface) const;

    ThemeKind currentTheme() const { return selectTheme(state_.hour); }
    const ClockState& state() const { return state_; }

private:
    void drawInfoPanel(Surface& surface, const Theme& theme) const;
    void drawFace(Surface& surface, const Theme& theme) const;
    void drawHourMarks(Surface& surface, const Theme& theme) const;
    void drawHand(Surface& surface, double angle, double length, int width,
                  const Rgb& color, const Theme& theme) const;

    ClockGeometry geometry_;
    std::string weatherUrl_;
    ClockState state_;
};

} // namespace aclock

#endif
