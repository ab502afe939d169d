#pragma once

namespace geoseq::core {

constexpr double PI = 3.14159265358979323846;
constexpr double EARTH_RADIUS = 6378137.0;

// Great-circle distance in meters
double haversine_distance(double lat1, double lon1, double lat2, double lon2);

// Initial bearing from point 1 to point 2, degrees [0, 360)
double compute_bearing(double lat1, double lon1, double lat2, double lon2);

// Wraps any angle into [0, 360)
double normalize_bearing(double deg);

// Shortest signed rotation from a to b, in (-180, 180]
double signed_bearing_delta(double a, double b);

// Unsigned angular difference, [0, 180]
double diff_bearing(double a, double b);

} // namespace geoseq::core
