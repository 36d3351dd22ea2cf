#ifndef ACLOCK_TESTS_RECORDING_SURFACE_H
#define ACLOCK_TESTS_RECORDING_SURFACE_H

#include <string>
#include <vector>

#include "surface.h"

namespace aclock {

struct DrawCall {
    enum Kind { Fill, Text, Circle, Line };

    Kind kind;
    double x1, y1, x2, y2;
    int size;           // radius for circles, width for lines
    Rgba color;
    std::string text;
};

class RecordingSurface : public Surface {
public:
    void fill(const Rgb& color) override {
        DrawCall c = make(DrawCall::Fill);
        c.color = opaque(color);
        calls.push_back(c);
    }

    void drawText(int centerX, int centerY, const std::string& text, const Rgb& color) override {
        DrawCall c = make(DrawCall::Text);
        c.x1 = centerX;
        c.y1 = centerY;
        c.text = text;
        c.color = opaque(color);
        calls.push_back(c);
    }

    void fillCircle(int cx, int cy, int radius, const Rgb& color) override {
        DrawCall c = make(DrawCall::Circle);
        c.x1 = cx;
        c.y1 = cy;
        c.size = radius;
        c.color = opaque(color);
        calls.push_back(c);
    }

    void drawLine(double x1, double y1, double x2, double y2, int width, const Rgba& color) override {
        DrawCall c = make(DrawCall::Line);
        c.x1 = x1;
        c.y1 = y1;
        c.x2 = x2;
        c.y2 = y2;
        c.size = width;
        c.color = color;
        calls.push_back(c);
    }

    std::vector<DrawCall> calls;

private:
    static DrawCall make(DrawCall::Kind kind) {
        DrawCall c;
        c.kind = kind;
        c.x1 = c.y1 = c.x2 = c.y2 = 0;
        c.size = 0;
        c.color = Rgba{ 0, 0, 0, 0 };
        return c;
    }
};

} // namespace aclock

#endif
