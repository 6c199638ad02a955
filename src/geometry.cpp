#include "geometry.h"
#include <cmath>

namespace netoverlay {

double normalize_degrees(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0) r += 360.0;
    // fmod of a tiny negative value can round up to exactly 360
    if (r >= 360.0) r -= 360.0;
    return r;
}

Point rotate_point(const Point& pt, double angle_deg) {
    double rad = deg_to_rad(angle_deg);
    double cos_a = std::cos(rad);
    double sin_a = std::sin(rad);
    return {pt.x * cos_a - pt.y * sin_a,
            pt.x * sin_a + pt.y * cos_a};
}

Point point_on_circle(const Point& center, double radius, double angle_deg) {
    double rad = deg_to_rad(angle_deg);
    return {center.x + radius * std::cos(rad),
            center.y + radius * std::sin(rad)};
}

std::vector<Point> oriented_rect(const Point& a, const Point& b,
                                 double extra_length, double width) {
    double len = distance(a, b) + extra_length;
    double angle = angle_deg(a, b);
    Point center = (a + b) * 0.5;

    double hl = len / 2.0;
    double hw = width / 2.0;
    const Point corners[4] = {{-hl, -hw}, {hl, -hw}, {hl, hw}, {-hl, hw}};

    std::vector<Point> out;
    out.reserve(4);
    for (auto& c : corners) {
        out.push_back(center + rotate_point(c, angle));
    }
    return out;
}

} // namespace netoverlay
