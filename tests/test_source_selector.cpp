#include "geoseq/core/errors.hpp"
#include "geoseq/geotag/source_selector.hpp"
#include "support/mp4_builder.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geoseq;
using Catch::Approx;

namespace {

const char* QUICKTIME_XML = R"(<?xml version='1.0' encoding='UTF-8'?>
<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>
<rdf:Description rdf:about='clip.mp4'
  xmlns:QuickTime='http://ns.exiftool.org/QuickTime/QuickTime/1.0/'
  xmlns:UserData='http://ns.exiftool.org/QuickTime/UserData/1.0/'>
 <UserData:Make>DJI</UserData:Make>
 <UserData:Model>Osmo Action</UserData:Model>
 <QuickTime:GPSDateTime>2023:01:02 10:30:00Z</QuickTime:GPSDateTime>
 <QuickTime:GPSLatitude>37.7749</QuickTime:GPSLatitude>
 <QuickTime:GPSLongitude>-122.4194</QuickTime:GPSLongitude>
 <QuickTime:GPSDateTime>2023:01:02 10:30:01Z</QuickTime:GPSDateTime>
 <QuickTime:GPSLatitude>37.7750</QuickTime:GPSLatitude>
 <QuickTime:GPSLongitude>-122.4195</QuickTime:GPSLongitude>
</rdf:Description>
</rdf:RDF>
)";

class FakeRunner : public io::ExiftoolRunner {
public:
    explicit FakeRunner(std::string output) : output_(std::move(output)) {}
    std::string run(const fs::path&) override {
        ++calls;
        return output_;
    }
    int calls = 0;

private:
    std::string output_;
};

SourceSpec spec(SourceKind kind, const std::string& pattern = "") {
    SourceSpec s;
    s.kind = kind;
    s.pattern = pattern;
    return s;
}

std::string geotagging_message(const geotag::SourceSelector& selector, const fs::path& media,
                               const std::vector<SourceSpec>& specs) {
    try {
        selector.select(media, specs);
    } catch (const GeotaggingError& e) {
        return e.what();
    }
    return "";
}

} // namespace

TEST_CASE("expand_source_pattern_tokens") {
    const fs::path media = "/data/v/GH010001.MP4";
    REQUIRE(geotag::expand_source_pattern(media, "%g.gpx") == fs::path("/data/v/GH010001.gpx"));
    REQUIRE(geotag::expand_source_pattern(media, "%f.xml") == fs::path("/data/v/GH010001.MP4.xml"));
    REQUIRE(geotag::expand_source_pattern(media, "/tracks/%g%e") == fs::path("/tracks/GH010001.MP4"));
    REQUIRE(geotag::expand_source_pattern(media, "gps/%g.nmea") == fs::path("/data/v/gps/GH010001.nmea"));
    REQUIRE(geotag::expand_source_pattern(media, "100%") == fs::path("/data/v/100%"));
}

TEST_CASE("resolve_source_path_requires_a_regular_file") {
    auto dir = testing::make_temp_dir("resolve");
    const fs::path media = dir / "clip.mp4";
    testing::write_file(dir / "clip.gpx", std::string("<gpx/>"));
    fs::create_directories(dir / "clip.nmea");

    REQUIRE(*geotag::resolve_source_path(media, "%g.gpx") == dir / "clip.gpx");
    REQUIRE_FALSE(geotag::resolve_source_path(media, "%g.nmea").has_value());
    REQUIRE_FALSE(geotag::resolve_source_path(media, "%g.xml").has_value());
}

TEST_CASE("check_source_patterns_rejects_fixed_paths_for_many_videos") {
    const std::vector<SourceSpec> fixed = {spec(SourceKind::GPX, "ride.gpx")};
    REQUIRE_NOTHROW(geotag::check_source_patterns(fixed, 1));
    REQUIRE_THROWS_AS(geotag::check_source_patterns(fixed, 2), ConfigError);

    const std::vector<SourceSpec> defaults = {spec(SourceKind::GPX), spec(SourceKind::VIDEO)};
    REQUIRE_NOTHROW(geotag::check_source_patterns(defaults, 5));
}

TEST_CASE("select_falls_through_to_next_source") {
    auto dir = testing::make_temp_dir("select");
    const fs::path media = testing::write_file(dir / "clip.mp4", testing::Bytes{1, 2, 3, 4});

    FakeRunner runner(QUICKTIME_XML);
    geotag::SourceSelector selector(&runner);

    auto selected = selector.select(media, {spec(SourceKind::GPX), spec(SourceKind::VIDEO),
                                            spec(SourceKind::EXIFTOOL_RUNTIME)});
    REQUIRE(selected.source == SourceKind::EXIFTOOL_RUNTIME);
    REQUIRE(selected.source_path == media);
    REQUIRE(selected.telemetry.make == "DJI");
    REQUIRE(selected.telemetry.model == "Osmo Action");
    REQUIRE(selected.telemetry.points.size() == 2);
    REQUIRE(selected.telemetry.points[0].time == Approx(1672655400.0));
    REQUIRE(runner.calls == 1);
}

TEST_CASE("select_prefers_first_working_source") {
    auto dir = testing::make_temp_dir("select_first");
    const fs::path media = testing::write_file(dir / "clip.mp4", testing::Bytes{1, 2, 3, 4});
    testing::write_file(dir / "clip.gpx", std::string(R"(<gpx><trk><trkseg>
<trkpt lat="1" lon="2"><time>2023-01-02T10:30:00Z</time></trkpt>
</trkseg></trk></gpx>)"));

    FakeRunner runner(QUICKTIME_XML);
    geotag::SourceSelector selector(&runner);
    auto selected = selector.select(media, {spec(SourceKind::GPX), spec(SourceKind::EXIFTOOL_RUNTIME)});
    REQUIRE(selected.source == SourceKind::GPX);
    REQUIRE(selected.source_path == dir / "clip.gpx");
    REQUIRE(runner.calls == 0);
}

TEST_CASE("select_reports_last_failure") {
    auto dir = testing::make_temp_dir("select_fail");
    const fs::path media = testing::write_file(dir / "clip.mp4", testing::Bytes{1, 2, 3, 4});
    geotag::SourceSelector selector;

    const std::string missing = geotagging_message(selector, media, {spec(SourceKind::VIDEO), spec(SourceKind::GPX)});
    REQUIRE(missing.find("gpx source not found") != std::string::npos);

    const std::string no_tool = geotagging_message(selector, media, {spec(SourceKind::EXIFTOOL_RUNTIME)});
    REQUIRE(no_tool == "exiftool is not available");

    REQUIRE(geotagging_message(selector, media, {}) == "No geotag source configured");
}

TEST_CASE("select_exiftool_xml_matches_record_by_name") {
    auto dir = testing::make_temp_dir("select_xml");
    const fs::path media = testing::write_file(dir / "clip.mp4", testing::Bytes{1, 2, 3, 4});
    testing::write_file(dir / "clip.xml", std::string(QUICKTIME_XML));

    geotag::SourceSelector selector;
    auto selected = selector.select(media, {spec(SourceKind::EXIFTOOL_XML)});
    REQUIRE(selected.source == SourceKind::EXIFTOOL_XML);
    REQUIRE(selected.telemetry.points.size() == 2);
}

TEST_CASE("parse_rejects_exif_source_for_videos") {
    geotag::SourceSelector selector;
    REQUIRE_THROWS_AS(selector.parse(SourceKind::EXIF, "/x.mp4", "/x.mp4"), ParseError);
}
