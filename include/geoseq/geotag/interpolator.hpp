#pragma once

#include "geoseq/config/configuration.hpp"
#include "geoseq/core/types.hpp"

#include <optional>
#include <vector>

namespace geoseq::geotag {

struct Location {
    double lat = 0.0;
    double lon = 0.0;
    std::optional<double> alt;
    std::optional<double> angle;
};

/**
 * Position on a time-sorted track at time t.
 * Latitude, longitude and altitude are interpolated linearly, heading along
 * the shorter arc. Times up to `tolerance` seconds outside the track clamp to
 * the nearest end point; further out is an OutsideTrackError. An empty track
 * or a single point queried away from its sample is an AlignmentError.
 */
Location locate(const Track& track, double t, double tolerance = 0.001);

// raw + interpolation offset
double corrected_time(double raw_time, const config::InterpolationConfig& cfg);

// Sets time = raw_time + offset on the given records; with use_gpx_start_time the
// whole set is then shifted so its earliest capture lands on the first track point
void align_capture_times(std::vector<CaptureRecord*>& records, const Track& track,
                         const config::InterpolationConfig& cfg);

// Resolves position and heading of each record from the track, recording per-record errors
void geotag_from_track(std::vector<CaptureRecord*>& records, const Track& track,
                       const config::InterpolationConfig& cfg);

} // namespace geoseq::geotag
