#include "geoseq/core/errors.hpp"
#include "geoseq/telemetry/nmea_parser.hpp"
#include "support/mp4_builder.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geoseq;
using Catch::Approx;

namespace {

const std::string RMC = "$GPRMC,103000.000,A,3746.4940,N,12225.1640,W,10.0,90.0,020123,,,A*7E";
const std::string GGA = "$GPGGA,103001.000,3746.5000,N,12225.1700,W,1,08,0.9,12.5,M,,M,,*67";
const std::string GGA_NO_FIX = "$GPGGA,103002.000,3746.5100,N,12225.1800,W,0,00,,,M,,M,,*5C";

constexpr double MIDNIGHT_2023_01_02 = 1672617600.0;

} // namespace

TEST_CASE("nmea_sentence_checksum") {
    auto ok = telemetry::parse_nmea_sentence(RMC);
    REQUIRE(ok.has_value());
    REQUIRE(ok->talker == "GP");
    REQUIRE(ok->type == "RMC");
    REQUIRE(ok->fields[0] == "103000.000");

    std::string bad = RMC;
    bad.replace(bad.size() - 2, 2, "00");
    REQUIRE_FALSE(telemetry::parse_nmea_sentence(bad).has_value());

    // No checksum at all is accepted
    REQUIRE(telemetry::parse_nmea_sentence(RMC.substr(0, RMC.find('*'))).has_value());
    REQUIRE_FALSE(telemetry::parse_nmea_sentence("GPRMC,1,2,3").has_value());
}

TEST_CASE("nmea_rmc_decodes_position_date_and_speed") {
    auto fix = telemetry::parse_rmc(*telemetry::parse_nmea_sentence(RMC));
    REQUIRE(fix.has_value());
    REQUIRE(fix->lat == Approx(37.7749));
    REQUIRE(fix->lon == Approx(-122.4194));
    REQUIRE(fix->time_of_day == Approx(37800.0));
    REQUIRE(fix->date->year == 2023);
    REQUIRE(fix->date->month == 1);
    REQUIRE(fix->date->day == 2);
    REQUIRE(*fix->speed == Approx(5.14444));
    REQUIRE(*fix->course == Approx(90.0));
}

TEST_CASE("nmea_void_rmc_is_rejected") {
    auto s = telemetry::parse_nmea_sentence("$GPRMC,103000.000,V,3746.4940,N,12225.1640,W,,,020123,,,N");
    REQUIRE(s.has_value());
    REQUIRE_FALSE(telemetry::parse_rmc(*s).has_value());
}

TEST_CASE("nmea_gga_quality_zero_is_rejected") {
    auto good = telemetry::parse_gga(*telemetry::parse_nmea_sentence(GGA));
    REQUIRE(good.has_value());
    REQUIRE(*good->alt == Approx(12.5));
    REQUIRE(*good->fix == GPSFix::FIX_3D);

    REQUIRE_FALSE(telemetry::parse_gga(*telemetry::parse_nmea_sentence(GGA_NO_FIX)).has_value());
}

TEST_CASE("nmea_gll_decodes_position") {
    auto s = telemetry::parse_nmea_sentence("$GPGLL,3746.4940,N,12225.1640,W,103000.000,A,A");
    REQUIRE(s.has_value());
    auto fix = telemetry::parse_gll(*s);
    REQUIRE(fix.has_value());
    REQUIRE(fix->lat == Approx(37.7749));
    REQUIRE(fix->time_of_day == Approx(37800.0));
}

TEST_CASE("nmea_text_dates_gga_points_from_rmc") {
    const std::string text = RMC + "\r\n" + GGA + "\r\n" + GGA_NO_FIX + "\r\n\r\n";
    Track track = telemetry::parse_nmea_text(text);
    REQUIRE(track.size() == 1);
    REQUIRE(track[0].time == Approx(MIDNIGHT_2023_01_02 + 37801.0));
    REQUIRE(track[0].lat == Approx(37.775));
    REQUIRE(*track[0].alt == Approx(12.5));
}

TEST_CASE("nmea_gga_before_first_rmc_takes_first_known_date") {
    const std::string early = "$GPGGA,102959.000,3746.4900,N,12225.1600,W,1,08,0.9,12.0,M,,M,,";
    Track track = telemetry::parse_nmea_text(early + "\n" + RMC + "\n" + GGA + "\n");
    REQUIRE(track.size() == 2);
    REQUIRE(track[0].time == Approx(MIDNIGHT_2023_01_02 + 37799.0));
    REQUIRE(track[1].time == Approx(MIDNIGHT_2023_01_02 + 37801.0));
}

TEST_CASE("nmea_without_dated_points_is_parse_error") {
    REQUIRE_THROWS_AS(telemetry::parse_nmea_text(GGA + "\n"), ParseError);
    REQUIRE_THROWS_AS(telemetry::parse_nmea_text(RMC + "\n"), ParseError);
    REQUIRE_THROWS_AS(telemetry::parse_nmea_text(""), ParseError);
}

TEST_CASE("nmea_file_reading") {
    auto dir = testing::make_temp_dir("nmea");
    auto path = testing::write_file(dir / "track.nmea", RMC + "\n" + GGA + "\n");
    REQUIRE(telemetry::parse_nmea_file(path).size() == 1);
    REQUIRE_THROWS_AS(telemetry::parse_nmea_file(dir / "missing.nmea"), IOError);
}
