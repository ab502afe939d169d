#include "geoseq/core/errors.hpp"
#include "geoseq/telemetry/gpx_parser.hpp"
#include "support/mp4_builder.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geoseq;
using Catch::Approx;

namespace {

std::string gpx_document(const std::string& points) {
    return R"(<?xml version="1.0" encoding="UTF-8"?>
<gpx version="1.1" creator="test" xmlns="http://www.topografix.com/GPX/1/1">
  <trk><name>ride</name><trkseg>
)" + points + R"(
  </trkseg></trk>
</gpx>
)";
}

} // namespace

TEST_CASE("gpx_reads_timed_track_points_in_time_order") {
    const std::string xml = gpx_document(R"(
    <trkpt lat="37.7750" lon="-122.4195"><ele>12.0</ele><time>2023-01-02T10:30:05Z</time></trkpt>
    <trkpt lat="37.7749" lon="-122.4194"><ele>10.0</ele><time>2023-01-02T10:30:00Z</time>
      <extensions><speed>3.0</speed></extensions></trkpt>
    <trkpt lat="37.7751" lon="-122.4196"><ele>11.0</ele></trkpt>
)");
    Track track = telemetry::parse_gpx_text(xml);
    REQUIRE(track.size() == 2);
    REQUIRE(track[0].time == Approx(1672655400.0));
    REQUIRE(track[0].lat == Approx(37.7749));
    REQUIRE(*track[0].alt == Approx(10.0));
    REQUIRE(track[1].time == Approx(1672655405.0));
    REQUIRE(track[1].lon == Approx(-122.4195));
}

TEST_CASE("gpx_without_elevation_leaves_altitude_unset") {
    Track track = telemetry::parse_gpx_text(gpx_document(
        R"(<trkpt lat="1.5" lon="2.5"><time>2023-01-02T10:30:00.250Z</time></trkpt>)"));
    REQUIRE(track.size() == 1);
    REQUIRE_FALSE(track[0].alt.has_value());
    REQUIRE(track[0].time == Approx(1672655400.25));
}

TEST_CASE("gpx_course_is_normalized_into_0_360") {
    Track track = telemetry::parse_gpx_text(gpx_document(R"(
    <trkpt lat="1.0" lon="2.0"><time>2023-01-02T10:30:00Z</time><course>-5</course></trkpt>
    <trkpt lat="1.1" lon="2.1"><time>2023-01-02T10:30:01Z</time><course>360</course></trkpt>
)"));
    REQUIRE(track.size() == 2);
    REQUIRE(*track[0].angle == Approx(355.0));
    REQUIRE(*track[1].angle == Approx(0.0));
}

TEST_CASE("gpx_merges_multiple_tracks") {
    const std::string xml = R"(<gpx>
  <trk><trkseg><trkpt lat="1" lon="1"><time>2023-01-02T10:30:01Z</time></trkpt></trkseg></trk>
  <trk><trkseg><trkpt lat="2" lon="2"><time>2023-01-02T10:30:00Z</time></trkpt></trkseg></trk>
</gpx>)";
    Track track = telemetry::parse_gpx_text(xml);
    REQUIRE(track.size() == 2);
    REQUIRE(track[0].lat == Approx(2.0));
}

TEST_CASE("gpx_errors") {
    SECTION("malformed xml") {
        REQUIRE_THROWS_AS(telemetry::parse_gpx_text("<gpx><trk><trkpt lat=\"1\""), ParseError);
    }
    SECTION("no timed points") {
        REQUIRE_THROWS_AS(telemetry::parse_gpx_text(gpx_document(R"(<trkpt lat="1" lon="2"/>)")),
                          ParseError);
    }
    SECTION("missing file") {
        auto dir = testing::make_temp_dir("gpx");
        REQUIRE_THROWS_AS(telemetry::parse_gpx_file(dir / "missing.gpx"), IOError);
    }
}

TEST_CASE("gpx_file_reading") {
    auto dir = testing::make_temp_dir("gpx");
    auto path = testing::write_file(dir / "track.gpx", gpx_document(
        R"(<trkpt lat="1.5" lon="2.5"><time>2023-01-02T10:30:00Z</time></trkpt>)"));
    REQUIRE(telemetry::parse_gpx_file(path).size() == 1);
}
