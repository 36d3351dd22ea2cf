#ifndef ACLOCK_WEATHER_H
#define ACLOCK_WEATHER_H

#include <string>

namespace aclock {

extern const char* const WEATHER_FALLBACK_TEXT;

struct HttpResponse {
    long status = 0;
    std::string body;
};

class HttpClient {
public:
    virtual ~HttpClient() {}

    // Returns false and sets error on transport failure (DNS, connect,
    // timeout). Any HTTP status, including errors, counts as a response.
    virtual bool get(const std::string& url, HttpResponse& response, std::string& error) = 0;
};

enum class WeatherError { NoError, Transport, BadStatus };

struct WeatherResult {
    WeatherError error = WeatherError::NoError;
    std::string text;
    long status = 0;
    std::string detail;

    bool ok() const { return error == WeatherError::NoError; }
};

WeatherResult fetchWeather(HttpClient& client, const std::string& url);

// Text shown in the info panel for a fetch result.
std::string weatherDisplayText(const WeatherResult& result);

std::string trim(const std::string& s);

} // namespace aclock

#endif
