#include "geoseq/geotag/interpolator.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/geo.hpp"
#include "geoseq/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace geoseq::geotag {

namespace {

std::optional<double> heading_of(const GPSPoint& p) {
    if (p.angle) {
        return core::normalize_bearing(*p.angle);
    }
    return std::nullopt;
}

Location at_point(const GPSPoint& p) {
    return {p.lat, p.lon, p.alt, heading_of(p)};
}

std::optional<double> lerp(const std::optional<double>& a, const std::optional<double>& b, double f) {
    if (a && b) {
        return *a + (*b - *a) * f;
    }
    return f < 0.5 ? a : b;
}

std::string describe_time(double t) {
    std::ostringstream oss;
    oss << core::format_capture_time(t) << " (" << std::fixed << t << ")";
    return oss.str();
}

} // namespace

Location locate(const Track& track, double t, double tolerance) {
    if (track.empty()) {
        throw AlignmentError("Cannot interpolate on an empty track");
    }

    const GPSPoint& first = track.front();
    const GPSPoint& last = track.back();

    if (t < first.time) {
        if (first.time - t <= tolerance) {
            return at_point(first);
        }
        if (track.size() == 1) {
            throw AlignmentError("Track has a single point at " + describe_time(first.time));
        }
        throw OutsideTrackError("Capture time " + describe_time(t) + " is before the track start " +
                                describe_time(first.time));
    }
    if (t > last.time) {
        if (t - last.time <= tolerance) {
            return at_point(last);
        }
        if (track.size() == 1) {
            throw AlignmentError("Track has a single point at " + describe_time(last.time));
        }
        throw OutsideTrackError("Capture time " + describe_time(t) + " is after the track end " +
                                describe_time(last.time));
    }

    // first point with time > t; p0 is the one before it
    auto it = std::upper_bound(track.begin(), track.end(), t,
                               [](double v, const GPSPoint& p) { return v < p.time; });
    if (it == track.end()) {
        return at_point(last);
    }
    const GPSPoint& p1 = *it;
    const GPSPoint& p0 = *(it - 1);

    const double span = p1.time - p0.time;
    const double f = span > 0.0 ? (t - p0.time) / span : 0.0;

    Location loc;
    loc.lat = p0.lat + (p1.lat - p0.lat) * f;
    loc.lon = p0.lon + (p1.lon - p0.lon) * f;
    loc.alt = lerp(p0.alt, p1.alt, f);

    if (f == 0.0) {
        loc.angle = heading_of(p0);
    } else if (f == 1.0) {
        loc.angle = heading_of(p1);
    } else if (p0.angle && p1.angle) {
        const double delta = core::signed_bearing_delta(*p0.angle, *p1.angle);
        loc.angle = core::normalize_bearing(*p0.angle + f * delta);
    }
    return loc;
}

double corrected_time(double raw_time, const config::InterpolationConfig& cfg) {
    return raw_time + cfg.offset_time;
}

void align_capture_times(std::vector<CaptureRecord*>& records, const Track& track,
                         const config::InterpolationConfig& cfg) {
    for (auto* r : records) {
        r->time = corrected_time(r->raw_time, cfg);
    }
    if (!cfg.use_gpx_start_time || records.empty() || track.empty()) {
        return;
    }
    const auto earliest = std::min_element(records.begin(), records.end(),
        [](const CaptureRecord* a, const CaptureRecord* b) { return a->time < b->time; });
    const double shift = track.front().time - (*earliest)->time;
    for (auto* r : records) {
        r->time += shift;
    }
}

void geotag_from_track(std::vector<CaptureRecord*>& records, const Track& track,
                       const config::InterpolationConfig& cfg) {
    align_capture_times(records, track, cfg);
    for (auto* r : records) {
        try {
            Location loc = locate(track, r->time, cfg.extrapolation_tolerance);
            r->lat = loc.lat;
            r->lon = loc.lon;
            r->alt = loc.alt;
            if (!r->angle) {
                r->angle = loc.angle;
            }
        } catch (const OutsideTrackError& e) {
            r->error = CaptureError{ErrorKind::OUTSIDE_TRACK, e.what()};
        } catch (const AlignmentError& e) {
            r->error = CaptureError{ErrorKind::ALIGNMENT, e.what()};
        }
    }
}

} // namespace geoseq::geotag
