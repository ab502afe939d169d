#include "geoseq/core/geo.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geoseq::core;
using Catch::Approx;

TEST_CASE("haversine_distance_of_one_degree_latitude") {
    REQUIRE(haversine_distance(0.0, 0.0, 0.0, 0.0) == Approx(0.0));
    // one degree of arc on a sphere of radius 6378137 m
    REQUIRE(haversine_distance(0.0, 0.0, 1.0, 0.0) == Approx(111319.49).epsilon(1e-6));
    REQUIRE(haversine_distance(10.0, 20.0, 10.5, 20.5) == Approx(haversine_distance(10.5, 20.5, 10.0, 20.0)));
}

TEST_CASE("compute_bearing_cardinal_directions") {
    REQUIRE(compute_bearing(0.0, 0.0, 1.0, 0.0) == Approx(0.0).margin(1e-9));
    REQUIRE(compute_bearing(0.0, 0.0, 0.0, 1.0) == Approx(90.0));
    REQUIRE(compute_bearing(0.0, 0.0, -1.0, 0.0) == Approx(180.0));
    REQUIRE(compute_bearing(0.0, 0.0, 0.0, -1.0) == Approx(270.0));
}

TEST_CASE("normalize_bearing_wraps_into_0_360") {
    REQUIRE(normalize_bearing(360.0) == Approx(0.0));
    REQUIRE(normalize_bearing(-10.0) == Approx(350.0));
    REQUIRE(normalize_bearing(725.0) == Approx(5.0));
    REQUIRE(normalize_bearing(-1e-15) < 360.0);
}

TEST_CASE("bearing_delta_takes_the_short_way_round") {
    REQUIRE(signed_bearing_delta(350.0, 10.0) == Approx(20.0));
    REQUIRE(signed_bearing_delta(10.0, 350.0) == Approx(-20.0));
    REQUIRE(signed_bearing_delta(0.0, 180.0) == Approx(180.0));
    REQUIRE(diff_bearing(359.0, 1.0) == Approx(2.0));
    REQUIRE(diff_bearing(90.0, 270.0) == Approx(180.0));
}
