#include "x11_surface.h"

#include <X11/Xutil.h>
#include <X11/keysym.h>

#include <cmath>
#include <iostream>
#include <vector>

#include "utf8.h"

using namespace std;

namespace aclock {

namespace {

const char* const FONTSET_PATTERN = "-*-*-medium-r-normal--20-*-*-*-*-*-*-*,*";
const char* const CORE_FONTS[] = {
    "-misc-fixed-medium-r-normal--20-*-*-*-*-*-iso10646-1",
    "-misc-fixed-medium-r-normal--13-*-*-*-*-*-iso10646-1",
    "fixed"
};

unsigned long colorKey(const Rgb& c) {
    return (static_cast<unsigned long>(c.r) << 16) | (c.g << 8) | c.b;
}

} // namespace

X11Window::X11Window()
    : display_(nullptr), window_(0), screen_(0), wmDeleteWindow_(0), width_(0), height_(0) {
}

X11Window::~X11Window() {
    if (display_) {
        if (window_) XDestroyWindow(display_, window_);
        XCloseDisplay(display_);
    }
}

bool X11Window::open(const string& title, int width, int height) {
    display_ = XOpenDisplay(nullptr);
    if (!display_) {
        cerr << "[x11] cannot open display" << endl;
        return false;
    }

    screen_ = DefaultScreen(display_);
    Window root = RootWindow(display_, screen_);

    width_ = width;
    height_ = height;
    window_ = XCreateSimpleWindow(display_, root, 50, 50, width_, height_, 1,
                                  BlackPixel(display_, screen_),
                                  BlackPixel(display_, screen_));
    XStoreName(display_, window_, title.c_str());
    XSelectInput(display_, window_, ExposureMask | KeyPressMask | StructureNotifyMask);

    wmDeleteWindow_ = XInternAtom(display_, "WM_DELETE_WINDOW", False);
    XSetWMProtocols(display_, window_, &wmDeleteWindow_, 1);

    XMapWindow(display_, window_);
    return true;
}

InputEvents X11Window::poll() {
    InputEvents events;
    while (XPending(display_)) {
        XEvent ev;
        XNextEvent(display_, &ev);
        if (ev.type == ConfigureNotify) {
            if (ev.xconfigure.width != width_ || ev.xconfigure.height != height_) {
                width_ = ev.xconfigure.width;
                height_ = ev.xconfigure.height;
                events.resized = true;
            }
        } else if (ev.type == ClientMessage) {
            if (static_cast<Atom>(ev.xclient.data.l[0]) == wmDeleteWindow_) {
                events.quit = true;
            }
        } else if (ev.type == KeyPress) {
            KeySym ks = XLookupKeysym(&ev.xkey, 0);
            if (ks == XK_Escape || ks == XK_q || ks == XK_Q) {
                events.quit = true;
            } else if (ks == XK_r || ks == XK_R) {
                events.refreshWeather = true;
            }
        }
    }
    return events;
}

X11Surface::X11Surface(X11Window& window)
    : window_(window), gc_(nullptr), pixmap_(0), fontSet_(nullptr), font_(nullptr),
      width_(0), height_(0) {
}

X11Surface::~X11Surface() {
    Display* d = window_.display();
    if (!d) return;

    if (!colors_.empty()) {
        vector<unsigned long> pixels;
        for (const auto& entry : colors_) {
            pixels.push_back(entry.second);
        }
        XFreeColors(d, DefaultColormap(d, window_.screen()), pixels.data(), static_cast<int>(pixels.size()), 0);
    }
    if (fontSet_) XFreeFontSet(d, fontSet_);
    if (font_) XFreeFont(d, font_);
    if (pixmap_) XFreePixmap(d, pixmap_);
    if (gc_) XFreeGC(d, gc_);
}

bool X11Surface::init() {
    Display* d = window_.display();
    gc_ = XCreateGC(d, window_.window(), 0, nullptr);
    if (!loadFont()) return false;
    resize(window_.width(), window_.height());
    return pixmap_ != 0;
}

bool X11Surface::loadFont() {
    Display* d = window_.display();

    char** missing = nullptr;
    int missingCount = 0;
    char* defString = nullptr;
    fontSet_ = XCreateFontSet(d, FONTSET_PATTERN, &missing, &missingCount, &defString);
    if (missing) XFreeStringList(missing);
    if (fontSet_) return true;

    for (const char* name : CORE_FONTS) {
        font_ = XLoadQueryFont(d, name);
        if (font_) {
            cerr << "[x11] no font set for this locale, using core font \"" << name << "\"" << endl;
            XSetFont(d, gc_, font_->fid);
            return true;
        }
    }
    cerr << "[x11] cannot load any core font" << endl;
    return false;
}

void X11Surface::resize(int width, int height) {
    if (width <= 0 || height <= 0) return;
    if (pixmap_ && width == width_ && height == height_) return;

    Display* d = window_.display();
    if (pixmap_) XFreePixmap(d, pixmap_);
    width_ = width;
    height_ = height;
    pixmap_ = XCreatePixmap(d, window_.window(), width_, height_,
                            DefaultDepth(d, window_.screen()));
}

void X11Surface::present() {
    Display* d = window_.display();
    XCopyArea(d, pixmap_, window_.window(), gc_, 0, 0, width_, height_, 0, 0);
    XFlush(d);
}

unsigned long X11Surface::pixel(const Rgb& color) {
    unsigned long key = colorKey(color);
    auto it = colors_.find(key);
    if (it != colors_.end()) return it->second;
    it = fallbackColors_.find(key);
    if (it != fallbackColors_.end()) return it->second;

    Display* d = window_.display();
    XColor xc;
    xc.red = color.r * 257;
    xc.green = color.g * 257;
    xc.blue = color.b * 257;
    xc.flags = DoRed | DoGreen | DoBlue;
    if (!XAllocColor(d, DefaultColormap(d, window_.screen()), &xc)) {
        cerr << "[x11] cannot allocate color " << int(color.r) << "," << int(color.g) << "," << int(color.b) << endl;
        int luma = (color.r * 299 + color.g * 587 + color.b * 114) / 1000;
        unsigned long px = luma > 127 ? WhitePixel(d, window_.screen()) : BlackPixel(d, window_.screen());
        fallbackColors_[key] = px;
        return px;
    }
    colors_[key] = xc.pixel;
    return xc.pixel;
}

void X11Surface::fill(const Rgb& color) {
    Display* d = window_.display();
    backdrop_.reset(color);
    XSetForeground(d, gc_, pixel(color));
    XFillRectangle(d, pixmap_, gc_, 0, 0, width_, height_);
}

void X11Surface::drawText(int centerX, int centerY, const string& text, const Rgb& color) {
    Display* d = window_.display();
    XSetForeground(d, gc_, pixel(color));
    int len = static_cast<int>(text.size());

    if (fontSet_) {
        XRectangle ink, logical;
        Xutf8TextExtents(fontSet_, text.c_str(), len, &ink, &logical);
        int x = centerX - logical.width / 2;
        int y = centerY - logical.height / 2 - logical.y;
        Xutf8DrawString(d, pixmap_, fontSet_, gc_, x, y, text.c_str(), len);
    } else {
        // core fonts index glyphs by code point, not by UTF-8 byte
        bool wide = font_->max_byte1 > 0;
        vector<XChar2b> glyphs;
        for (uint32_t cp : decodeUtf8(text)) {
            if (cp > 0xFFFF || (!wide && cp > 0xFF)) cp = REPLACEMENT_CHAR;
            XChar2b g;
            g.byte1 = static_cast<unsigned char>(cp >> 8);
            g.byte2 = static_cast<unsigned char>(cp & 0xFF);
            glyphs.push_back(g);
        }
        int count = static_cast<int>(glyphs.size());
        int y = centerY + (font_->ascent - font_->descent) / 2;
        if (wide) {
            int w = XTextWidth16(font_, glyphs.data(), count);
            XDrawString16(d, pixmap_, gc_, centerX - w / 2, y, glyphs.data(), count);
        } else {
            string bytes;
            for (const XChar2b& g : glyphs) bytes.push_back(static_cast<char>(g.byte2));
            int w = XTextWidth(font_, bytes.c_str(), count);
            XDrawString(d, pixmap_, gc_, centerX - w / 2, y, bytes.c_str(), count);
        }
    }
}

void X11Surface::fillCircle(int cx, int cy, int radius, const Rgb& color) {
    if (radius <= 0) return;
    Display* d = window_.display();
    XSetForeground(d, gc_, pixel(color));
    XFillArc(d, pixmap_, gc_, cx - radius, cy - radius, 2 * radius, 2 * radius, 0, 360 * 64);
    backdrop_.addCircle(cx, cy, radius, color);
}

void X11Surface::drawLine(double x1, double y1, double x2, double y2, int width, const Rgba& color) {
    Display* d = window_.display();
    // no alpha in core X11: blend against whatever lies under the midpoint
    Rgb under = backdrop_.colorAt((x1 + x2) / 2, (y1 + y2) / 2);
    XSetForeground(d, gc_, pixel(blendOver(color, under)));
    XSetLineAttributes(d, gc_, width, LineSolid, CapRound, JoinRound);
    XDrawLine(d, pixmap_, gc_,
              static_cast<int>(lround(x1)), static_cast<int>(lround(y1)),
              static_cast<int>(lround(x2)), static_cast<int>(lround(y2)));
}

} // namespace aclock
