#include "weather.h"

#include <cctype>
#include <iostream>

using namespace std;

namespace aclock {

const char* const WEATHER_FALLBACK_TEXT = "Weather unavailable";

string trim(const string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

WeatherResult fetchWeather(HttpClient& client, const string& url) {
    WeatherResult result;
    HttpResponse response;
    string error;

    if (!client.get(url, response, error)) {
        result.error = WeatherError::Transport;
        result.detail = error;
        cerr << "[weather] request failed: " << error << endl;
        return result;
    }

    result.status = response.status;
    if (response.status != 200) {
        result.error = WeatherError::BadStatus;
        result.detail = "HTTP " + to_string(response.status);
        cerr << "[weather] unexpected status " << response.status << endl;
        return result;
    }

    result.text = trim(response.body);
    return result;
}

string weatherDisplayText(const WeatherResult& result) {
    return result.ok() ? result.text : string(WEATHER_FALLBACK_TEXT);
}

} // namespace aclock
