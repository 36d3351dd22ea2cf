#ifndef ACLOCK_X11_SURFACE_H
#define ACLOCK_X11_SURFACE_H

#include <X11/Xlib.h>

#include <map>
#include <string>

#include "backdrop.h"
#include "surface.h"

namespace aclock {

struct InputEvents {
    bool quit = false;
    bool refreshWeather = false;
    bool resized = false;
};

// Top-level window plus its display connection.
class X11Window {
public:
    X11Window();
    ~X11Window();
    X11Window(const X11Window&) = delete;
    X11Window& operator=(const X11Window&) = delete;

    bool open(const std::string& title, int width, int height);

    // Drains the event queue without blocking.
    InputEvents poll();

    Display* display() const { return display_; }
    Window window() const { return window_; }
    int screen() const { return screen_; }
    int width() const { return width_; }
    int height() const { return height_; }

private:
    Display* display_;
    Window window_;
    int screen_;
    Atom wmDeleteWindow_;
    int width_;
    int height_;
};

// Draws into an off-screen pixmap; present() copies it to the window.
class X11Surface : public Surface {
public:
    explicit X11Surface(X11Window& window);
    ~X11Surface();
    X11Surface(const X11Surface&) = delete;
    X11Surface& operator=(const X11Surface&) = delete;

    bool init();
    void resize(int width, int height);
    void present();

    void fill(const Rgb& color) override;
    void drawText(int centerX, int centerY, const std::string& text, const Rgb& color) override;
    void fillCircle(int cx, int cy, int radius, const Rgb& color) override;
    void drawLine(double x1, double y1, double x2, double y2, int width, const Rgba& color) override;

private:
    bool loadFont();
    unsigned long pixel(const Rgb& color);

    X11Window& window_;
    GC gc_;
    Pixmap pixmap_;
    XFontSet fontSet_;
    XFontStruct* font_;
    int width_;
    int height_;
    Backdrop backdrop_;
    std::map<unsigned long, unsigned long> colors_;
    // colors the colormap refused, mapped to black or white
    std::map<unsigned long, unsigned long> fallbackColors_;
};

} // namespace aclock

#endif
