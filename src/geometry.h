#pragma once

#include <cmath>
#include <vector>
#include <string>

namespace netoverlay {

constexpr double PI = 3.14159265358979323846;

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x, double y) : x(x), y(y) {}

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    Point operator*(double s) const { return {x * s, y * s}; }
    bool operator==(const Point& o) const {
        return std::abs(x - o.x) < 1e-6 && std::abs(y - o.y) < 1e-6;
    }
};

inline double distance(const Point& a, const Point& b) {
    double dx = a.x - b.x, dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

inline double deg_to_rad(double deg) { return deg * PI / 180.0; }
inline double rad_to_deg(double rad) { return rad * 180.0 / PI; }

// Angle of the vector from -> to, in degrees (atan2 convention)
inline double angle_deg(const Point& from, const Point& to) {
    return rad_to_deg(std::atan2(to.y - from.y, to.x - from.x));
}

// Normalize an angle into [0, 360)
double normalize_degrees(double deg);

// Rotate a point around the origin by angle_deg (counter-clockwise in a Y-up frame)
Point rotate_point(const Point& pt, double angle_deg);

// Point on a circle of the given radius around center, at angle_deg
Point point_on_circle(const Point& center, double radius, double angle_deg);

// Flip Y coordinate: KiCad schematic (Y+ down) <-> draw space (Y+ up)
inline Point flip_y(const Point& pt) { return {pt.x, -pt.y}; }

// Corners of a rectangle of the given length/width centered on the segment a-b
// and oriented along it
std::vector<Point> oriented_rect(const Point& a, const Point& b,
                                 double extra_length, double width);

} // namespace netoverlay
