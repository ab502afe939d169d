#include "geoseq/core/geo.hpp"

#include <cmath>

namespace geoseq::core {

namespace {

double to_rad(double deg) { return deg * PI / 180.0; }

} // namespace

double haversine_distance(double lat1, double lon1, double lat2, double lon2) {
    const double dlat = to_rad(lat2 - lat1);
    const double dlon = to_rad(lon2 - lon1);
    const double a = std::sin(dlat / 2) * std::sin(dlat / 2) +
                     std::cos(to_rad(lat1)) * std::cos(to_rad(lat2)) *
                     std::sin(dlon / 2) * std::sin(dlon / 2);
    const double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
    return EARTH_RADIUS * c;
}

double compute_bearing(double lat1, double lon1, double lat2, double lon2) {
    const double lat1_rad = to_rad(lat1);
    const double lat2_rad = to_rad(lat2);
    const double delta_lon_rad = to_rad(lon2 - lon1);

    const double y = std::sin(delta_lon_rad) * std::cos(lat2_rad);
    const double x = std::cos(lat1_rad) * std::sin(lat2_rad) -
                     std::sin(lat1_rad) * std::cos(lat2_rad) * std::cos(delta_lon_rad);
    return normalize_bearing(std::atan2(y, x) * 180.0 / PI);
}

double normalize_bearing(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0.0) {
        r += 360.0;
    }
    // fmod of a tiny negative can round up to exactly 360
    if (r >= 360.0) {
        r = 0.0;
    }
    return r;
}

double signed_bearing_delta(double a, double b) {
    double d = std::fmod(b - a, 360.0);
    if (d <= -180.0) {
        d += 360.0;
    } else if (d > 180.0) {
        d -= 360.0;
    }
    return d;
}

double diff_bearing(double a, double b) {
    return std::fabs(signed_bearing_delta(a, b));
}

} // namespace geoseq::core
