#include "geoseq/core/errors.hpp"
#include "geoseq/telemetry/blackvue_parser.hpp"
#include "support/mp4_builder.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geoseq;
using namespace geoseq::testing;
using Catch::Approx;

namespace {

// Camera clock runs at UTC+2
constexpr double UTC_103000 = 1672655400.0;
constexpr int64_t CAMERA_MS_103000 = (1672655400LL + 7200LL) * 1000LL;

std::string line(int64_t camera_ms, const std::string& sentence) {
    return "[" + std::to_string(camera_ms) + "]" + sentence + "\n";
}

const std::string RMC_0 = "$GPRMC,103000.000,A,3746.4940,N,12225.1640,W,10.0,90.0,020123,,,A";
const std::string RMC_1 = "$GPRMC,103001.000,A,3746.5000,N,12225.1700,W,10.0,90.0,020123,,,A";
const std::string GGA_0 = "$GPGGA,103000.000,3746.4940,N,12225.1640,W,1,08,0.9,12.5,M,,M,,";
const std::string GGA_1 = "$GPGGA,103001.000,3746.5000,N,12225.1700,W,1,08,0.9,13.5,M,,M,,";

std::string gps_data_with_rmc() {
    return line(CAMERA_MS_103000, RMC_0) + line(CAMERA_MS_103000, GGA_0) +
           line(CAMERA_MS_103000 + 1000, RMC_1) + line(CAMERA_MS_103000 + 1000, GGA_1);
}

} // namespace

TEST_CASE("blackvue_timezone_offset_from_rmc") {
    REQUIRE(telemetry::blackvue_timezone_offset(gps_data_with_rmc()) == Approx(7200.0));
}

TEST_CASE("blackvue_timezone_offset_falls_back_to_gga") {
    const std::string data = line(CAMERA_MS_103000, GGA_0) + line(CAMERA_MS_103000 + 1000, GGA_1);
    REQUIRE(telemetry::blackvue_timezone_offset(data) == Approx(7200.0));
}

TEST_CASE("blackvue_timezone_offset_without_fixes_is_zero") {
    REQUIRE(telemetry::blackvue_timezone_offset("garbage\n[12]$GPTXT,hello\n") == Approx(0.0));
}

TEST_CASE("blackvue_track_prefers_rmc_points") {
    Track track = telemetry::parse_blackvue_gps_data(gps_data_with_rmc());
    REQUIRE(track.size() == 2);
    REQUIRE(track[0].time == Approx(UTC_103000));
    REQUIRE(track[1].time == Approx(UTC_103000 + 1.0));
    REQUIRE(track[0].lat == Approx(37.7749));
    REQUIRE_FALSE(track[0].alt.has_value()); // RMC carries no altitude
}

TEST_CASE("blackvue_track_uses_gga_without_rmc") {
    const std::string data = line(CAMERA_MS_103000, GGA_0) + line(CAMERA_MS_103000 + 1000, GGA_1);
    Track track = telemetry::parse_blackvue_gps_data(data);
    REQUIRE(track.size() == 2);
    REQUIRE(track[0].time == Approx(UTC_103000));
    REQUIRE(*track[1].alt == Approx(13.5));
}

TEST_CASE("blackvue_model_from_cprt") {
    REQUIRE(telemetry::parse_blackvue_model(R"({"model":"DR900X-2CH"})") == "DR900X-2CH");
    REQUIRE(telemetry::parse_blackvue_model(R"({"vendor":"x"})").empty());
    REQUIRE(telemetry::parse_blackvue_model(" Pittasoft Co., Ltd.;DR900S-1CH;1.006;English;") == "DR900S-1CH");
    REQUIRE(telemetry::parse_blackvue_model("").empty());
}

TEST_CASE("parse_blackvue_reads_free_box_after_padding") {
    const std::string gps = gps_data_with_rmc();
    Bytes payload;
    append(payload, box("gps ", Bytes(gps.begin(), gps.end())));
    const std::string cprt = R"({"model":"DR750X-1CH"})";
    append(payload, box("cprt", Bytes(cprt.begin(), cprt.end())));

    io::Mp4Reader reader(build_mp4({}, 1600000000.0, {}, {box("free", Bytes(16, 0)), box("free", payload)}));
    auto result = telemetry::parse_blackvue(reader);
    REQUIRE(result.make == "BlackVue");
    REQUIRE(result.model == "DR750X-1CH");
    REQUIRE(result.points.size() == 2);
    REQUIRE(result.points[0].time == Approx(UTC_103000));
}

TEST_CASE("parse_blackvue_errors") {
    SECTION("no gps box") {
        io::Mp4Reader reader(build_mp4({}, 1600000000.0));
        REQUIRE_THROWS_AS(telemetry::parse_blackvue(reader), ParseError);
    }
    SECTION("gps box without fixes") {
        const std::string gps = "[1000]$GPTXT,01,01,02,hello\n";
        Bytes payload = box("gps ", Bytes(gps.begin(), gps.end()));
        io::Mp4Reader reader(build_mp4({}, 1600000000.0, {}, {box("free", payload)}));
        REQUIRE_THROWS_AS(telemetry::parse_blackvue(reader), ParseError);
    }
}

TEST_CASE("blackvue_very_long_line_is_skipped") {
    const std::string data = line(CAMERA_MS_103000, "$GPRMC," + std::string(200000, 'x')) +
                             gps_data_with_rmc();
    Track track = telemetry::parse_blackvue_gps_data(data);
    REQUIRE(track.size() == 2);
    REQUIRE(track[0].time == Approx(UTC_103000));
}

TEST_CASE("blackvue_line_with_trailing_counter_and_crlf") {
    const std::string data = "[" + std::to_string(CAMERA_MS_103000) + "]" + RMC_0 + " [1]\r\n" +
                             "[" + std::to_string(CAMERA_MS_103000 + 1000) + "] " + RMC_1 + "\r\n";
    Track track = telemetry::parse_blackvue_gps_data(data);
    REQUIRE(track.size() == 2);
    REQUIRE(track[1].time == Approx(UTC_103000 + 1.0));
}
