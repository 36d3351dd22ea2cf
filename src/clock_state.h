#ifndef ACLOCK_CLOCK_STATE_H
#define ACLOCK_CLOCK_STATE_H

#include <string>

namespace aclock {

// Broken-down local wall-clock time with microsecond resolution.
struct LocalTime {
    int year = 1970;
    int month = 1;      // 1-12
    int day = 1;        // 1-31
    int weekday = 4;    // 0 = Sunday
    int hour = 0;       // 0-23
    int minute = 0;
    int second = 0;
    int microsecond = 0;
};

struct ClockState {
    double hourAngle = 0.0;
    double minuteAngle = 0.0;
    double secondAngle = 0.0;
    int hour = 0;
    std::string dateText;
    std::string weatherText = "Fetching...";
};

LocalTime localTimeNow();

// Angles are in degrees, clockwise from 12 o'clock.
double hourAngle(const LocalTime& t);
double minuteAngle(const LocalTime& t);
double secondAngle(const LocalTime& t);

// "Saturday, October 18, 2026"
std::string formatLongDate(const LocalTime& t);

} // namespace aclock

#endif
