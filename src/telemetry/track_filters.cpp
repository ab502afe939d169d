#include "geoseq/telemetry/track_filters.hpp"
#include "geoseq/core/errors.hpp"
#include "geoseq/core/geo.hpp"

#include <algorithm>
#include <iostream>
#include <limits>

namespace geoseq::telemetry {

namespace {

using Run = std::vector<GPSPoint>;

double median(const std::vector<double>& sorted, size_t begin, size_t end) {
    const size_t n = end - begin;
    if (n == 0) {
        throw GeoseqError("median of empty range");
    }
    const size_t mid = begin + n / 2;
    if (n % 2 == 1) {
        return sorted[mid];
    }
    return (sorted[mid - 1] + sorted[mid]) / 2.0;
}

double point_distance(const GPSPoint& a, const GPSPoint& b) {
    return core::haversine_distance(a.lat, a.lon, b.lat, b.lon);
}

double point_speed(const GPSPoint& a, const GPSPoint& b) {
    const double s = point_distance(a, b);
    const double t = std::fabs(b.time - a.time);
    if (t == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return s / t;
}

} // namespace

Track normalize_track(Track track) {
    std::stable_sort(track.begin(), track.end(),
                     [](const GPSPoint& a, const GPSPoint& b) { return a.time < b.time; });

    Track out;
    out.reserve(track.size());
    for (const auto& p : track) {
        if (!out.empty()) {
            const auto& last = out.back();
            if (last.time == p.time && last.lat == p.lat && last.lon == p.lon) {
                continue;
            }
        }
        out.push_back(p);
    }

    interpolate_subseconds(out, [](GPSPoint& p) -> double& { return p.time; });
    return out;
}

double upper_whisker(std::vector<double> values) {
    const size_t n = values.size();
    if (n < 2) {
        throw GeoseqError("at least 2 values are required for IQR");
    }
    std::sort(values.begin(), values.end());

    const size_t median_idx = n / 2;
    const double q1 = median(values, 0, median_idx);
    // odd n: the median itself belongs to neither half
    const double q3 = (n % 2 == 1) ? median(values, median_idx + 1, n)
                                   : median(values, median_idx, n);
    return q3 + (q3 - q1) * 1.5;
}

Track remove_outliers(const Track& track, double gps_precision_m) {
    std::vector<double> distances;
    for (size_t i = 1; i < track.size(); ++i) {
        distances.push_back(point_distance(track[i - 1], track[i]));
    }
    if (distances.size() < 2) {
        return track;
    }

    // Distance between two points, hence twice the receiver precision
    const double max_distance = std::max(gps_precision_m * 2.0, upper_whisker(distances));

    std::vector<Run> runs;
    for (size_t i = 0; i < track.size(); ++i) {
        if (!runs.empty() && point_distance(track[i - 1], track[i]) <= max_distance) {
            runs.back().push_back(track[i]);
        } else {
            runs.push_back({track[i]});
        }
    }

    std::vector<double> speeds;
    for (const auto& p : track) {
        if (p.ground_speed) {
            speeds.push_back(*p.ground_speed);
        }
    }
    if (speeds.size() < 2) {
        return track;
    }
    const double max_speed = upper_whisker(speeds);

    // One-dimensional DBSCAN over runs: each run joins the first later run it can reach
    std::vector<size_t> merge_to(runs.size(), std::numeric_limits<size_t>::max());
    for (size_t left = 0; left < runs.size(); ++left) {
        if (merge_to[left] == std::numeric_limits<size_t>::max()) {
            merge_to[left] = left;
        }
        for (size_t right = left + 1; right < runs.size(); ++right) {
            if (merge_to[right] != std::numeric_limits<size_t>::max()) {
                continue;
            }
            if (point_speed(runs[left].back(), runs[right].front()) <= max_speed) {
                merge_to[right] = merge_to[left];
                break;
            }
        }
    }

    std::vector<size_t> cluster_order;
    std::vector<Run> clusters(runs.size());
    for (size_t i = 0; i < runs.size(); ++i) {
        const size_t target = merge_to[i];
        if (clusters[target].empty()) {
            cluster_order.push_back(target);
        }
        clusters[target].insert(clusters[target].end(), runs[i].begin(), runs[i].end());
    }

    size_t best = cluster_order.front();
    for (size_t idx : cluster_order) {
        if (clusters[idx].size() > clusters[best].size()) {
            best = idx;
        }
    }
    return clusters[best];
}

Track remove_noisy_points(const Track& track, const config::VideoConfig& cfg) {
    Track filtered;
    filtered.reserve(track.size());
    size_t bad_fix = 0;
    size_t bad_precision = 0;

    for (const auto& p : track) {
        if (p.fix && std::find(cfg.gps_fixes.begin(), cfg.gps_fixes.end(),
                               static_cast<int>(*p.fix)) == cfg.gps_fixes.end()) {
            ++bad_fix;
            continue;
        }
        if (p.precision && *p.precision > cfg.max_dop100) {
            ++bad_precision;
            continue;
        }
        filtered.push_back(p);
    }

    if (bad_fix > 0 || bad_precision > 0) {
        std::cerr << "[FILTER] Removed " << bad_fix << " points without accepted fix and "
                  << bad_precision << " points with DOP above " << cfg.max_dop100 << std::endl;
    }

    const size_t before = filtered.size();
    filtered = remove_outliers(filtered, cfg.gps_precision_m);
    if (filtered.size() < before) {
        std::cerr << "[FILTER] Removed " << (before - filtered.size()) << " outlier points" << std::endl;
    }
    return filtered;
}

double max_distance_from_start(const Track& track) {
    double max_d = 0.0;
    if (track.empty()) {
        return max_d;
    }
    for (const auto& p : track) {
        max_d = std::max(max_d, point_distance(track.front(), p));
    }
    return max_d;
}

bool is_stationary(const Track& track, double radius_m) {
    return max_distance_from_start(track) <= radius_m;
}

} // namespace geoseq::telemetry
