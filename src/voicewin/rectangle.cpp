#include "rectangle.hpp"

#include <cmath>
#include <format>

namespace {

// Map a coordinate along one axis. A degenerate source axis collapses onto
// the destination origin.
double map_axis(double value, double from_origin, double from_extent, double to_extent) {
    if (from_extent == 0.0) return 0.0;
    return (value - from_origin) * to_extent / from_extent;
}

} // namespace

void Rectangle::renormalize(const Rectangle& from, const Rectangle& to) {
    x = map_axis(x, from.x, from.dx, to.dx) + to.x;
    y = map_axis(y, from.y, from.dy, to.dy) + to.y;
    dx = map_axis(dx, 0.0, from.dx, to.dx);
    dy = map_axis(dy, 0.0, from.dy, to.dy);
}

Rectangle Rectangle::renormalized(const Rectangle& from, const Rectangle& to) const {
    Rectangle r = *this;
    r.renormalize(from, to);
    return r;
}

int Rectangle::ltwh_left() const { return static_cast<int>(std::lround(x)); }
int Rectangle::ltwh_top() const { return static_cast<int>(std::lround(y)); }
int Rectangle::ltwh_width() const { return static_cast<int>(std::lround(dx)); }
int Rectangle::ltwh_height() const { return static_cast<int>(std::lround(dy)); }

std::string Rectangle::to_string() const {
    return std::format("Rectangle({}, {}, {}, {})", x, y, dx, dy);
}
