#include <X11/Xlib.h>
#include <unistd.h>
#include <clocale>
#include <ctime>
#include <iostream>

#include "clock_renderer.h"
#include "config.h"
#include "curl_http_client.h"
#include "x11_surface.h"

using namespace std;
using namespace aclock;

static long long monotonicMicros() {
    timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<long long>(ts.tv_sec) * 1000000 + ts.tv_nsec / 1000;
}

static void refresh(ClockRenderer& renderer, HttpClient& http) {
    WeatherResult result = renderer.refreshWeather(http);
    if (result.ok()) {
        cout << "[weather] " << result.text << endl;
    }
}

int main() {
    // date names and the info panel font follow the user's locale
    setlocale(LC_ALL, "");
    if (!XSupportsLocale()) {
        cerr << "[x11] locale not supported, falling back to C" << endl;
        setlocale(LC_ALL, "C");
    }
    XSetLocaleModifiers("");

    AppConfig config;

    CurlGlobal curlGlobal;
    if (!curlGlobal.ok()) {
        cerr << "[weather] curl_global_init failed, weather will show as unavailable" << endl;
    }
    CurlHttpClient http(curlGlobal, config.weatherTimeoutSec);

    X11Window window;
    if (!window.open(config.title, config.windowWidth, config.windowHeight)) {
        return 1;
    }

    X11Surface surface(window);
    if (!surface.init()) {
        cerr << "[x11] cannot set up drawing surface" << endl;
        return 1;
    }

    ClockRenderer renderer(config.geometry, config.weatherUrl);
    // fetched once before the first frame; later only on request
    refresh(renderer, http);

    ThemeKind lastTheme = selectTheme(localTimeNow().hour);
    cout << "[clock] theme " << themeName(lastTheme) << endl;

    const long long frameMicros = 1000000 / config.framesPerSecond;

    while (true) {
        long long frameStart = monotonicMicros();

        InputEvents input = window.poll();
        if (input.quit) {
            break;
        }
        if (input.resized) {
            surface.resize(window.width(), window.height());
        }
        if (input.refreshWeather) {
            refresh(renderer, http);
        }

        renderer.update();
        if (renderer.currentTheme() != lastTheme) {
            lastTheme = renderer.currentTheme();
            cout << "[clock] theme " << themeName(lastTheme) << endl;
        }

        renderer.draw(surface);
        surface.present();

        long long elapsed = monotonicMicros() - frameStart;
        if (elapsed < frameMicros) {
            usleep(static_cast<useconds_t>(frameMicros - elapsed));
        }
    }

    return 0;
}
