#include "clock_renderer.h"

#include <cmath>

using namespace std;

namespace aclock {

namespace {

const double PI = 3.14159265358979323846;

const int MIDDLE_FACE_INSET = 30;
const int INNER_FACE_INSET = 40;
const int MARK_OUTER_INSET = 20;
const int MARK_INNER_INSET = 40;
const int MARK_WIDTH = 5;
const int CENTER_CAP_RADIUS = 10;

double toRadians(double degrees) {
    return degrees * PI / 180.0;
}

} // namespace

ClockRenderer::ClockRenderer(const ClockGeometry& geometry, const string& weatherUrl)
    : geometry_(geometry), weatherUrl_(weatherUrl) {
}

void ClockRenderer::update() {
    update(localTimeNow());
}

void ClockRenderer::update(const LocalTime& now) {
    state_.hourAngle = hourAngle(now);
    state_.minuteAngle = minuteAngle(now);
    state_.secondAngle = secondAngle(now);
    state_.hour = now.hour;
    state_.dateText = formatLongDate(now);
}

WeatherResult ClockRenderer::refreshWeather(HttpClient& client) {
    WeatherResult result = fetchWeather(client, weatherUrl_);
    state_.weatherText = weatherDisplayText(result);
    return result;
}

void ClockRenderer::draw(Surface& surface) const {
    const Theme& theme = themeFor(currentTheme());
    double r = geometry_.radius;

    surface.fill(theme.background);
    drawInfoPanel(surface, theme);
    drawFace(surface, theme);
    drawHourMarks(surface, theme);
    drawHand(surface, state_.hourAngle, r * 0.5, 8, theme.handHour, theme);
    drawHand(surface, state_.minuteAngle, r * 0.7, 6, theme.handMinute, theme);
    drawHand(surface, state_.secondAngle, r * 0.9, 3, theme.handSecond, theme);
    surface.fillCircle(geometry_.centerX, geometry_.centerY, CENTER_CAP_RADIUS, theme.faceOuter);
}

void ClockRenderer::drawInfoPanel(Surface& surface, const Theme& theme) const {
    surface.drawText(geometry_.centerX, geometry_.infoY,
                     state_.dateText + " | " + state_.weatherText, theme.text);
}

void ClockRenderer::drawFace(Surface& surface, const Theme& theme) const {
    int cx = geometry_.centerX;
    int cy = geometry_.centerY;
    int r = geometry_.radius;
    surface.fillCircle(cx, cy, r, theme.faceOuter);
    surface.fillCircle(cx, cy, r - MIDDLE_FACE_INSET, theme.faceMiddle);
    surface.fillCircle(cx, cy, r - INNER_FACE_INSET, theme.faceInner);
}

void ClockRenderer::drawHourMarks(Surface& surface, const Theme& theme) const {
    double cx = geometry_.centerX;
    double cy = geometry_.centerY;
    double outer = geometry_.radius - MARK_OUTER_INSET;
    double inner = geometry_.radius - MARK_INNER_INSET;

    for (int i = 0; i < 12; ++i) {
        double a = toRadians(i * 30);
        double x1 = cx + outer * cos(a);
        double y1 = cy - outer * sin(a);
        double x2 = cx + inner * cos(a);
        double y2 = cy - inner * sin(a);
        surface.drawLine(x1, y1, x2, y2, MARK_WIDTH, opaque(theme.mark));
    }
}

void ClockRenderer::drawHand(Surface& surface, double angle, double length, int width,
                             const Rgb& color, const Theme& theme) const {
    // rotate so that 0 degrees points at 12 o'clock
    double a = toRadians(angle - 90);
    double cx = geometry_.centerX;
    double cy = geometry_.centerY;
    double x = cx + length * cos(a);
    double y = cy + length * sin(a);

    double off = geometry_.shadowOffset;
    surface.drawLine(cx + off, cy + off, x + off, y + off, width, theme.shadow);
    surface.drawLine(cx, cy, x, y, width, opaque(color));
}

} // namespace aclock
