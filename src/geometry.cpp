#include "geometry.h"
#include "utils.h"

#include <cmath>

namespace schsync {

double normalize_rotation(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0.0) r += 360.0;
    // fmod(-0.0) and values a hair under 360 both land on 0
    if (r >= 360.0 - 1e-9) r = 0.0;
    return r;
}

std::string format_point(const Point& pt) {
    return "(" + fmt(pt.x) + ", " + fmt(pt.y) + ")";
}

} // namespace schsync
