#pragma once

#include "geoseq/config/configuration.hpp"
#include "geoseq/core/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace geoseq::telemetry {

/**
 * Spreads items sharing the same millisecond evenly up to the next distinct
 * time (or the next whole second, whichever is earlier) so that sorting by
 * time stays unique and stable. Items must already be sorted by time.
 * time_of(item) must return a mutable reference to the item's time.
 */
template <typename T, typename TimeOf>
void interpolate_subseconds(std::vector<T>& items, TimeOf time_of) {
    size_t gidx = 0;
    while (gidx < items.size()) {
        const int64_t key = static_cast<int64_t>(time_of(items[gidx]) * 1e3);
        size_t glen = 1;
        while (gidx + glen < items.size() &&
               static_cast<int64_t>(time_of(items[gidx + glen]) * 1e3) == key) {
            ++glen;
        }
        if (glen > 1) {
            const double t = time_of(items[gidx]);
            const double next_second = std::floor(t + 1.0);
            double nt = next_second;
            if (gidx + glen < items.size()) {
                nt = std::min(time_of(items[gidx + glen]), next_second);
            }
            const double interval = (nt - t) / static_cast<double>(glen);
            for (size_t i = 0; i < glen; ++i) {
                time_of(items[gidx + i]) = t + static_cast<double>(i) * interval;
            }
        }
        gidx += glen;
    }
}

// Sort by time, drop consecutive exact duplicates, spread equal timestamps
Track normalize_track(Track track);

// Q3 + 1.5 * IQR. Requires at least 2 values.
double upper_whisker(std::vector<double> values);

// Splits at distance jumps, re-merges by plausible speed, keeps the largest run
Track remove_outliers(const Track& track, double gps_precision_m);

// Fix/precision filtering followed by outlier removal
Track remove_noisy_points(const Track& track, const config::VideoConfig& cfg);

double max_distance_from_start(const Track& track);
bool is_stationary(const Track& track, double radius_m);

} // namespace geoseq::telemetry
