#include "geometry.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace geometry {

static constexpr double DEG_TO_RAD = M_PI / 180.0;
static constexpr double RAD_TO_DEG = 180.0 / M_PI;

double get_length(const Vec2& v) {
    return std::hypot(v.x, v.y);
}

double get_angle(const Vec2& v) {
    // atan2 gives 0 = +x; rotate so that 0 points up
    return normalize_angle(std::atan2(v.y, v.x) * RAD_TO_DEG + 90.0);
}

Vec2 get_direction(double angle, double distance) {
    double rad = angle * DEG_TO_RAD;
    return {std::cos(rad) * distance, std::sin(rad) * distance};
}

double get_distance(const Vec2& a, const Vec2& b) {
    return get_length(a - b);
}

double normalize_angle(double angle) {
    double result = std::fmod(angle, 360.0);
    if (result < 0.0) {
        result += 360.0;
    }
    // fmod of a tiny negative value can round up to exactly 360
    if (result >= 360.0) {
        result -= 360.0;
    }
    return result;
}

double angle_difference(double a, double b) {
    double diff = normalize_angle(a - b);
    return diff > 180.0 ? 360.0 - diff : diff;
}

std::vector<double> compute_item_angles(std::size_t count, std::optional<double> parent_angle) {
    std::vector<double> angles;
    if (count == 0) {
        return angles;
    }

    double separation = 360.0 / static_cast<double>(count);
    double first = 0.0;

    if (parent_angle) {
        first = *parent_angle + separation / 2.0;
    }

    angles.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        angles.push_back(normalize_angle(first + static_cast<double>(i) * separation));
    }

    return angles;
}

std::vector<Wedge> compute_item_wedges(const std::vector<double>& angles,
                                       std::optional<double> parent_angle) {
    const std::size_t n = angles.size();
    std::vector<Wedge> wedges(n);

    if (n == 0) {
        return wedges;
    }

    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&angles](std::size_t a, std::size_t b) {
        return normalize_angle(angles[a]) < normalize_angle(angles[b]);
    });

    for (std::size_t k = 0; k < n; ++k) {
        std::size_t current = order[k];
        std::size_t prev = order[(k + n - 1) % n];
        std::size_t next = order[(k + 1) % n];

        double angle = normalize_angle(angles[current]);

        // With a single item both neighbours are the item itself
        double gap_before = n == 1 ? 360.0 : normalize_angle(angle - angles[prev]);
        double gap_after = n == 1 ? 360.0 : normalize_angle(angles[next] - angle);

        double start = angle - gap_before / 2.0;
        double end = angle + gap_after / 2.0;

        if (parent_angle) {
            double to_parent_before = normalize_angle(angle - *parent_angle);
            double to_parent_after = normalize_angle(*parent_angle - angle);

            if (to_parent_before > 0.0 && to_parent_before < gap_before) {
                start = angle - to_parent_before / 2.0;
            }
            if (to_parent_after > 0.0 && to_parent_after < gap_after) {
                end = angle + to_parent_after / 2.0;
            }
        }

        wedges[current] = {start, end};
    }

    return wedges;
}

bool wedge_contains(const Wedge& wedge, double angle) {
    for (double shifted : {angle, angle - 360.0, angle + 360.0}) {
        if (shifted > wedge.start && shifted <= wedge.end) {
            return true;
        }
    }
    return false;
}

} // namespace geometry
