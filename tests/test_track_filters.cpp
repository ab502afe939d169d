#include "geoseq/core/errors.hpp"
#include "geoseq/telemetry/track_filters.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geoseq;
using Catch::Approx;

namespace {

GPSPoint point(double time, double lat, double lon) {
    GPSPoint p;
    p.time = time;
    p.lat = lat;
    p.lon = lon;
    return p;
}

// Straight walk north-east, one point per second
Track walk(size_t n, double speed_ms) {
    Track track;
    for (size_t i = 0; i < n; ++i) {
        GPSPoint p = point(1000.0 + static_cast<double>(i), 48.0, 11.0 + 0.00001 * static_cast<double>(i));
        p.ground_speed = speed_ms;
        track.push_back(p);
    }
    return track;
}

} // namespace

TEST_CASE("interpolate_subseconds_spreads_equal_times") {
    std::vector<double> times = {10.0, 10.0, 10.0, 11.0, 12.5, 12.5};
    telemetry::interpolate_subseconds(times, [](double& t) -> double& { return t; });
    REQUIRE(times[0] == Approx(10.0));
    REQUIRE(times[1] == Approx(10.0 + 1.0 / 3.0));
    REQUIRE(times[2] == Approx(10.0 + 2.0 / 3.0));
    REQUIRE(times[3] == Approx(11.0));
    // last group runs up to the next whole second
    REQUIRE(times[4] == Approx(12.5));
    REQUIRE(times[5] == Approx(12.75));
}

TEST_CASE("normalize_track_sorts_and_drops_exact_duplicates") {
    Track track = {point(3.0, 1.0, 1.0), point(1.0, 1.0, 1.0), point(1.0, 1.0, 1.0), point(2.0, 1.0, 1.0)};
    Track out = telemetry::normalize_track(track);
    REQUIRE(out.size() == 3);
    REQUIRE(out[0].time == Approx(1.0));
    REQUIRE(out[1].time == Approx(2.0));
    REQUIRE(out[2].time == Approx(3.0));
}

TEST_CASE("normalize_track_spreads_same_time_different_position") {
    Track out = telemetry::normalize_track({point(5.0, 1.0, 1.0), point(5.0, 1.0, 1.001)});
    REQUIRE(out.size() == 2);
    REQUIRE(out[0].time == Approx(5.0));
    REQUIRE(out[1].time == Approx(5.5));
}

TEST_CASE("upper_whisker") {
    REQUIRE(telemetry::upper_whisker({4.0, 1.0, 3.0, 2.0}) == Approx(6.5));
    REQUIRE(telemetry::upper_whisker({1.0, 2.0, 3.0, 4.0, 5.0}) == Approx(9.0));
    REQUIRE_THROWS_AS(telemetry::upper_whisker({1.0}), GeoseqError);
}

TEST_CASE("remove_outliers_drops_isolated_jump") {
    Track track = walk(20, 2.0);
    track[10].lat += 0.1; // ~11 km away

    Track out = telemetry::remove_outliers(track, 15.0);
    REQUIRE(out.size() == 19);
    for (const auto& p : out) {
        REQUIRE(p.lat == Approx(48.0));
    }
    REQUIRE(out[9].time == Approx(1009.0));
    REQUIRE(out[10].time == Approx(1011.0));
}

TEST_CASE("remove_outliers_keeps_tracks_without_speed") {
    Track track = walk(20, 2.0);
    for (auto& p : track) p.ground_speed.reset();
    track[10].lat += 0.1;
    REQUIRE(telemetry::remove_outliers(track, 15.0).size() == 20);
}

TEST_CASE("remove_noisy_points_filters_fix_and_precision") {
    config::VideoConfig cfg;
    Track track = walk(6, 2.0);
    track[1].fix = GPSFix::NO_FIX;
    track[2].fix = GPSFix::FIX_3D;
    track[3].precision = 5000.0;
    track[4].precision = 200.0;

    Track out = telemetry::remove_noisy_points(track, cfg);
    REQUIRE(out.size() == 4);
    REQUIRE(out[0].time == Approx(1000.0));
    REQUIRE(out[1].time == Approx(1002.0));
    REQUIRE(out[2].time == Approx(1004.0));

    cfg.gps_fixes = {3};
    track[2].fix = GPSFix::FIX_2D;
    REQUIRE(telemetry::remove_noisy_points(track, cfg).size() == 3);
}

TEST_CASE("is_stationary") {
    Track still = {point(0.0, 48.0, 11.0), point(1.0, 48.00001, 11.0), point(2.0, 48.0, 11.00002)};
    REQUIRE(telemetry::is_stationary(still, 10.0));
    REQUIRE(telemetry::max_distance_from_start({}) == 0.0);

    Track moving = walk(100, 2.0); // ~74 m
    REQUIRE_FALSE(telemetry::is_stationary(moving, 10.0));
    REQUIRE(telemetry::max_distance_from_start(moving) > 50.0);
}
