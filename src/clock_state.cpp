#include "clock_state.h"

#include <sys/time.h>
#include <ctime>

using namespace std;

namespace aclock {

LocalTime localTimeNow() {
    timeval tv;
    gettimeofday(&tv, nullptr);
    time_t secs = tv.tv_sec;
    tm parts;
    localtime_r(&secs, &parts);

    LocalTime t;
    t.year = parts.tm_year + 1900;
    t.month = parts.tm_mon + 1;
    t.day = parts.tm_mday;
    t.weekday = parts.tm_wday;
    t.hour = parts.tm_hour;
    t.minute = parts.tm_min;
    // tm_sec may be 60 on a leap second
    t.second = parts.tm_sec > 59 ? 59 : parts.tm_sec;
    t.microsecond = static_cast<int>(tv.tv_usec);
    return t;
}

double hourAngle(const LocalTime& t) {
    return (t.hour % 12) * 30 + t.minute * 0.5;
}

double minuteAngle(const LocalTime& t) {
    return t.minute * 6.0;
}

double secondAngle(const LocalTime& t) {
    return (t.second + t.microsecond / 1000000.0) * 6.0;
}

string formatLongDate(const LocalTime& t) {
    tm parts = {};
    parts.tm_year = t.year - 1900;
    parts.tm_mon = t.month - 1;
    parts.tm_mday = t.day;
    parts.tm_wday = t.weekday;
    parts.tm_hour = t.hour;
    parts.tm_min = t.minute;
    parts.tm_sec = t.second;

    char buf[128];
    size_t n = strftime(buf, sizeof(buf), "%A, %B %d, %Y", &parts);
    return string(buf, n);
}

} // namespace aclock
