#include <gtest/gtest.h>

#include "clock_renderer.h"
#include "recording_surface.h"

using namespace aclock;

namespace {

LocalTime at(int hour, int minute, int second, int microsecond = 0) {
    LocalTime t;
    t.year = 2025;
    t.month = 3;
    t.day = 5;
    t.weekday = 3;
    t.hour = hour;
    t.minute = minute;
    t.second = second;
    t.microsecond = microsecond;
    return t;
}

class ClockRendererTest : public ::testing::Test {
protected:
    ClockRendererTest() : clock(ClockGeometry(), "http://localhost/") {}

    std::vector<DrawCall> render(const LocalTime& t) {
        clock.update(t);
        RecordingSurface surface;
        clock.draw(surface);
        return surface.calls;
    }

    ClockRenderer clock;
};

} // namespace

TEST_F(ClockRendererTest, UpdateSetsAnglesAndDate) {
    clock.update(at(15, 30, 10, 250000));
    const ClockState& s = clock.state();
    EXPECT_DOUBLE_EQ(105.0, s.hourAngle);
    EXPECT_DOUBLE_EQ(180.0, s.minuteAngle);
    EXPECT_DOUBLE_EQ(61.5, s.secondAngle);
    EXPECT_EQ(15, s.hour);
    EXPECT_EQ("Wednesday, March 05, 2025", s.dateText);
}

TEST_F(ClockRendererTest, DrawOrder) {
    std::vector<DrawCall> calls = render(at(10, 10, 30));
    ASSERT_EQ(24u, calls.size());

    EXPECT_EQ(DrawCall::Fill, calls[0].kind);
    EXPECT_EQ(DrawCall::Text, calls[1].kind);
    for (int i = 2; i < 5; ++i) EXPECT_EQ(DrawCall::Circle, calls[i].kind);
    for (int i = 5; i < 17; ++i) EXPECT_EQ(DrawCall::Line, calls[i].kind);
    for (int i = 17; i < 23; ++i) EXPECT_EQ(DrawCall::Line, calls[i].kind);
    EXPECT_EQ(DrawCall::Circle, calls[23].kind);
}

TEST_F(ClockRendererTest, FaceCirclesShrink) {
    std::vector<DrawCall> calls = render(at(10, 0, 0));
    const Theme& theme = themeFor(ThemeKind::Light);

    EXPECT_EQ(250, calls[2].size);
    EXPECT_EQ(220, calls[3].size);
    EXPECT_EQ(210, calls[4].size);
    EXPECT_EQ(opaque(theme.faceOuter), calls[2].color);
    EXPECT_EQ(opaque(theme.faceMiddle), calls[3].color);
    EXPECT_EQ(opaque(theme.faceInner), calls[4].color);
    for (int i = 2; i < 5; ++i) {
        EXPECT_EQ(300, calls[i].x1);
        EXPECT_EQ(300, calls[i].y1);
    }

    EXPECT_EQ(10, calls[23].size);
    EXPECT_EQ(opaque(theme.faceOuter), calls[23].color);
}

TEST_F(ClockRendererTest, InfoPanelText) {
    std::vector<DrawCall> calls = render(at(10, 0, 0));
    EXPECT_EQ("Wednesday, March 05, 2025 | Fetching...", calls[1].text);
    EXPECT_EQ(300, calls[1].x1);
    EXPECT_EQ(50, calls[1].y1);
}

TEST_F(ClockRendererTest, HourMarks) {
    std::vector<DrawCall> calls = render(at(10, 0, 0));
    const Theme& theme = themeFor(ThemeKind::Light);

    for (int i = 5; i < 17; ++i) {
        EXPECT_EQ(5, calls[i].size);
        EXPECT_EQ(opaque(theme.mark), calls[i].color);
    }
    // 3 o'clock mark is the first one, 12 o'clock the fourth
    EXPECT_NEAR(530.0, calls[5].x1, 1e-9);
    EXPECT_NEAR(300.0, calls[5].y1, 1e-9);
    EXPECT_NEAR(510.0, calls[5].x2, 1e-9);
    EXPECT_NEAR(300.0, calls[8].x1, 1e-9);
    EXPECT_NEAR(70.0, calls[8].y1, 1e-9);
    EXPECT_NEAR(90.0, calls[8].y2, 1e-9);
}

TEST_F(ClockRendererTest, HandsPointClockwiseFromTwelve) {
    std::vector<DrawCall> calls = render(at(3, 0, 15));

    // hour hand: 90 degrees, half the radius
    const DrawCall& hour = calls[18];
    EXPECT_NEAR(300.0, hour.x1, 1e-9);
    EXPECT_NEAR(300.0, hour.y1, 1e-9);
    EXPECT_NEAR(425.0, hour.x2, 1e-9);
    EXPECT_NEAR(300.0, hour.y2, 1e-9);
    EXPECT_EQ(8, hour.size);

    // minute hand: straight up
    const DrawCall& minute = calls[20];
    EXPECT_NEAR(300.0, minute.x2, 1e-9);
    EXPECT_NEAR(125.0, minute.y2, 1e-9);
    EXPECT_EQ(6, minute.size);

    // second hand at 15 s: pointing right
    const DrawCall& second = calls[22];
    EXPECT_NEAR(525.0, second.x2, 1e-9);
    EXPECT_NEAR(300.0, second.y2, 1e-9);
    EXPECT_EQ(3, second.size);

    std::vector<DrawCall> half = render(at(6, 30, 45));
    EXPECT_NEAR(300.0, half[20].x2, 1e-9);
    EXPECT_NEAR(475.0, half[20].y2, 1e-9);
    EXPECT_NEAR(75.0, half[22].x2, 1e-9);
    EXPECT_NEAR(300.0, half[22].y2, 1e-9);
}

TEST_F(ClockRendererTest, EachHandHasOffsetShadow) {
    std::vector<DrawCall> calls = render(at(20, 47, 13, 400000));
    const Theme& theme = themeFor(ThemeKind::Dark);
    const Rgb colors[3] = { theme.handHour, theme.handMinute, theme.handSecond };

    for (int h = 0; h < 3; ++h) {
        const DrawCall& shadow = calls[17 + 2 * h];
        const DrawCall& hand = calls[18 + 2 * h];
        EXPECT_EQ(theme.shadow, shadow.color);
        EXPECT_EQ(opaque(colors[h]), hand.color);
        EXPECT_EQ(hand.size, shadow.size);
        EXPECT_NEAR(hand.x1 + 5, shadow.x1, 1e-9);
        EXPECT_NEAR(hand.y1 + 5, shadow.y1, 1e-9);
        EXPECT_NEAR(hand.x2 + 5, shadow.x2, 1e-9);
        EXPECT_NEAR(hand.y2 + 5, shadow.y2, 1e-9);
    }
}

TEST_F(ClockRendererTest, ThemeFlipsAtBoundaries) {
    EXPECT_EQ(opaque(themeFor(ThemeKind::Light).background), render(at(17, 59, 59, 999999))[0].color);
    EXPECT_EQ(opaque(themeFor(ThemeKind::Dark).background), render(at(18, 0, 0))[0].color);
    EXPECT_EQ(opaque(themeFor(ThemeKind::Dark).background), render(at(5, 59, 59))[0].color);
    EXPECT_EQ(opaque(themeFor(ThemeKind::Light).background), render(at(6, 0, 0))[0].color);

    clock.update(at(18, 0, 0));
    EXPECT_EQ(ThemeKind::Dark, clock.currentTheme());
    clock.update(at(6, 0, 0));
    EXPECT_EQ(ThemeKind::Light, clock.currentTheme());
}

TEST_F(ClockRendererTest, CustomGeometry) {
    ClockGeometry g;
    g.centerX = 100;
    g.centerY = 120;
    g.radius = 80;
    g.infoY = 10;
    g.shadowOffset = 2;
    ClockRenderer small(g, "http://localhost/");
    small.update(at(9, 0, 0));

    RecordingSurface surface;
    small.draw(surface);
    ASSERT_EQ(24u, surface.calls.size());
    EXPECT_EQ(10, surface.calls[1].y1);
    EXPECT_EQ(80, surface.calls[2].size);
    EXPECT_EQ(40, surface.calls[4].size);
    // hour hand at 9:00 points left, 0.5 * 80
    EXPECT_NEAR(60.0, surface.calls[18].x2, 1e-9);
    EXPECT_NEAR(120.0, surface.calls[18].y2, 1e-9);
    EXPECT_NEAR(62.0, surface.calls[17].x2, 1e-9);
}
