#pragma once

#include <string>

struct Point {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point&) const = default;
};

// Position and size in screen coordinates: (x, y) is the top-left corner,
// (dx, dy) the extent. Monitor-relative geometry uses the unit square.
struct Rectangle {
    double x = 0.0;
    double y = 0.0;
    double dx = 0.0;
    double dy = 0.0;

    double left() const { return x; }
    double top() const { return y; }
    double right() const { return x + dx; }
    double bottom() const { return y + dy; }
    Point top_left() const { return {x, y}; }
    Point bottom_right() const { return {x + dx, y + dy}; }
    Point center() const { return {x + dx / 2.0, y + dy / 2.0}; }

    // Half-open on both axes: the left and top edges belong to the
    // rectangle, the right and bottom edges belong to its neighbour.
    bool contains(const Point& p) const {
        return p.x >= x && p.x < x + dx && p.y >= y && p.y < y + dy;
    }

    void translate(double tx, double ty) {
        x += tx;
        y += ty;
    }

    // Map this rectangle from the `from` frame onto the `to` frame, e.g.
    // renormalize(monitor, unit) yields monitor-relative fractions.
    void renormalize(const Rectangle& from, const Rectangle& to);
    Rectangle renormalized(const Rectangle& from, const Rectangle& to) const;

    // Integer left/top/width/height as native move calls expect them.
    int ltwh_left() const;
    int ltwh_top() const;
    int ltwh_width() const;
    int ltwh_height() const;

    std::string to_string() const;

    bool operator==(const Rectangle&) const = default;
};

inline constexpr Rectangle unit{0.0, 0.0, 1.0, 1.0};
