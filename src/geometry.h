#pragma once

#include <cmath>
#include <string>

namespace schsync {

// KiCad schematic grid (mm)
constexpr double SCHEMATIC_GRID = 1.27;

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x, double y) : x(x), y(y) {}

    Point operator+(const Point& o) const { return {x + o.x, y + o.y}; }
    Point operator-(const Point& o) const { return {x - o.x, y - o.y}; }
    bool operator==(const Point& o) const {
        return std::abs(x - o.x) < 1e-6 && std::abs(y - o.y) < 1e-6;
    }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

// Snap a coordinate to the schematic grid
inline double snap_to_grid(double v) {
    return std::round(v / SCHEMATIC_GRID) * SCHEMATIC_GRID;
}

// Fold a rotation in degrees into [0, 360)
double normalize_rotation(double deg);

// "(x, y)" for reports
std::string format_point(const Point& pt);

} // namespace schsync
