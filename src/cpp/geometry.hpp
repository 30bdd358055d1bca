#pragma once

#include <optional>
#include <vector>

// 2D vector in screen space (y grows downward)
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    Vec2() = default;
    Vec2(double x, double y) : x(x), y(y) {}

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2& operator+=(const Vec2& o) {
        x += o.x;
        y += o.y;
        return *this;
    }
};

// Angular bounds of a wedge in degrees, start < end.
// Bounds may leave [0, 360) when the wedge crosses the 0/360 seam.
struct Wedge {
    double start = 0.0;
    double end = 0.0;
};

namespace geometry {

double get_length(const Vec2& v);

// Polar angle of v in degrees, 0 = up, clockwise on screen, range [0, 360)
double get_angle(const Vec2& v);

// Vector of the given length at angle degrees, 0 = +x, clockwise on screen
Vec2 get_direction(double angle, double distance);

double get_distance(const Vec2& a, const Vec2& b);

// Maps any angle into [0, 360)
double normalize_angle(double angle);

// Shortest angular distance between two angles, range [0, 180]
double angle_difference(double a, double b);

// Evenly spaced item directions. Without a parent angle the first item sits
// at 0. With a parent angle the parent direction falls exactly in the
// middle of the gap between the last and the first item.
std::vector<double> compute_item_angles(std::size_t count,
                                        std::optional<double> parent_angle = std::nullopt);

// Hit-test wedges for items at the given angles, returned in input order.
// Neighbouring wedges meet at the angular midpoint between their items. If a
// parent angle is given, the gap containing it is split at the midpoints
// between each flanking item and the parent, leaving a parent wedge
// uncovered.
std::vector<Wedge> compute_item_wedges(const std::vector<double>& angles,
                                       std::optional<double> parent_angle = std::nullopt);

// Returns true if angle lies inside (wedge.start, wedge.end], testing the
// unshifted angle and the angle shifted by +-360
bool wedge_contains(const Wedge& wedge, double angle);

} // namespace geometry
