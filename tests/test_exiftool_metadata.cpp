#include "geoseq/core/errors.hpp"
#include "geoseq/io/metadata_record.hpp"
#include "geoseq/telemetry/exiftool_video.hpp"
#include "geoseq/telemetry/image_exif.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geoseq;
using Catch::Approx;

namespace {

constexpr double T0 = 1672655400.0; // 2023-01-02 10:30:00 UTC

const char* TWO_IMAGES_XML = R"(<?xml version='1.0' encoding='UTF-8'?>
<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'>
<rdf:Description rdf:about='/data/run/IMG_0001.jpg'
  xmlns:et='http://ns.exiftool.org/1.0/' et:toolkit='Image::ExifTool 12.40'
  xmlns:IFD0='http://ns.exiftool.org/EXIF/IFD0/1.0/'
  xmlns:ExifIFD='http://ns.exiftool.org/EXIF/ExifIFD/1.0/'
  xmlns:GPS='http://ns.exiftool.org/EXIF/GPS/1.0/'
  xmlns:XMP-dc='http://ns.exiftool.org/XMP/XMP-dc/1.0/'>
 <IFD0:Make>Canon</IFD0:Make>
 <IFD0:Model>EOS R</IFD0:Model>
 <ExifIFD:DateTimeOriginal>2023:01:02 10:30:00</ExifIFD:DateTimeOriginal>
 <GPS:GPSLatitude>37.7749</GPS:GPSLatitude>
 <XMP-dc:Subject>
  <rdf:Bag>
   <rdf:li>street</rdf:li>
   <rdf:li>survey</rdf:li>
  </rdf:Bag>
 </XMP-dc:Subject>
</rdf:Description>
<rdf:Description rdf:about='/data/run/IMG_0002.jpg'
  xmlns:IFD0='http://ns.exiftool.org/EXIF/IFD0/1.0/'>
 <IFD0:Make>Nikon</IFD0:Make>
</rdf:Description>
</rdf:RDF>
)";

class FakeRunner : public io::ExiftoolRunner {
public:
    explicit FakeRunner(std::string output) : output_(std::move(output)) {}

    std::string run(const fs::path& path) override {
        last_path = path;
        return output_;
    }

    fs::path last_path;

private:
    std::string output_;
};

} // namespace

TEST_CASE("exiftool_xml_groups_tags_by_namespace") {
    auto records = io::parse_exiftool_xml(TWO_IMAGES_XML);
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].about == "/data/run/IMG_0001.jpg");
    REQUIRE(*records[0].get("IFD0:Make") == "Canon");
    REQUIRE(*records[0].get("ExifIFD:DateTimeOriginal") == "2023:01:02 10:30:00");
    REQUIRE(*records[0].get_double("GPS:GPSLatitude") == Approx(37.7749));
    REQUIRE(*records[0].get("XMP-dc:Subject") == "street survey");
    REQUIRE_FALSE(records[0].has("IFD0:Software"));
    REQUIRE(*records[1].get("IFD0:Make") == "Nikon");
    REQUIRE_FALSE(records[1].has("IFD0:Model"));
}

TEST_CASE("exiftool_xml_rejects_malformed_documents") {
    REQUIRE_THROWS_AS(io::parse_exiftool_xml("<rdf:RDF xmlns:rdf='x'><rdf:Description>"), ParseError);
    REQUIRE(io::parse_exiftool_xml("<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'/>").empty());
}

TEST_CASE("metadata_record_repeated_keys") {
    io::MetadataRecord rec;
    rec.add("Track1:GPSLatitude", "1.5");
    rec.add("Track1:GPSLatitude", "2.5");
    rec.add("IFD0:Orientation", "6");
    REQUIRE(*rec.get("Track1:GPSLatitude") == "1.5");
    REQUIRE(rec.get_all("Track1:GPSLatitude").size() == 2);
    REQUIRE(*rec.get_int("IFD0:Orientation") == 6);
    REQUIRE_FALSE(rec.get_double("IFD0:Missing").has_value());
}

TEST_CASE("find_record_for_matches_path_then_file_name") {
    auto records = io::parse_exiftool_xml(TWO_IMAGES_XML);
    const auto* exact = io::find_record_for(records, "/data/run/IMG_0002.jpg");
    REQUIRE(exact == &records[1]);
    const auto* by_name = io::find_record_for(records, "/elsewhere/IMG_0001.jpg");
    REQUIRE(by_name == &records[0]);
    REQUIRE(io::find_record_for(records, "/data/run/IMG_0003.jpg") == nullptr);
}

TEST_CASE("exiftool_metadata_reader_uses_first_record") {
    FakeRunner runner(TWO_IMAGES_XML);
    io::ExiftoolMetadataReader reader(runner);
    auto rec = reader.read("/data/run/IMG_0001.jpg");
    REQUIRE(runner.last_path == fs::path("/data/run/IMG_0001.jpg"));
    REQUIRE(*rec.get("IFD0:Model") == "EOS R");

    FakeRunner empty("<rdf:RDF xmlns:rdf='http://www.w3.org/1999/02/22-rdf-syntax-ns#'/>");
    io::ExiftoolMetadataReader empty_reader(empty);
    REQUIRE_THROWS_AS(empty_reader.read("/x.jpg"), ParseError);
}

TEST_CASE("image_exif_capture_time_combines_subsec_and_offset") {
    io::MetadataRecord rec;
    rec.add("ExifIFD:DateTimeOriginal", "2023:01:02 12:30:00");
    rec.add("ExifIFD:SubSecTimeOriginal", "25");
    rec.add("ExifIFD:OffsetTimeOriginal", "+02:00");
    REQUIRE(*telemetry::extract_capture_time(rec) == Approx(T0 + 0.25));
}

TEST_CASE("image_exif_capture_time_fallbacks") {
    SECTION("digitized") {
        io::MetadataRecord rec;
        rec.add("ExifIFD:CreateDate", "2023:01:02 10:30:00");
        REQUIRE(*telemetry::extract_capture_time(rec) == Approx(T0));
    }
    SECTION("modify date") {
        io::MetadataRecord rec;
        rec.add("IFD0:ModifyDate", "2023:01:02 10:30:00");
        rec.add("ExifIFD:SubSecTime", "5");
        REQUIRE(*telemetry::extract_capture_time(rec) == Approx(T0 + 0.5));
    }
    SECTION("gps stamps") {
        io::MetadataRecord rec;
        rec.add("GPS:GPSDateStamp", "2023:01:02");
        rec.add("GPS:GPSTimeStamp", "10:30:00.5");
        REQUIRE(*telemetry::extract_capture_time(rec) == Approx(T0 + 0.5));
    }
    SECTION("unset original date falls through") {
        io::MetadataRecord rec;
        rec.add("ExifIFD:DateTimeOriginal", "0000:00:00 00:00:00");
        rec.add("IFD0:ModifyDate", "2023:01:02 10:30:00");
        REQUIRE(*telemetry::extract_capture_time(rec) == Approx(T0));
    }
    SECTION("nothing") {
        io::MetadataRecord rec;
        rec.add("IFD0:Make", "Canon");
        REQUIRE_FALSE(telemetry::extract_capture_time(rec).has_value());
    }
}

TEST_CASE("image_exif_position_and_camera_fields") {
    io::MetadataRecord rec;
    rec.add("ExifIFD:DateTimeOriginal", "2023:01:02 10:30:00");
    rec.add("GPS:GPSLatitude", "37.7749");
    rec.add("GPS:GPSLatitudeRef", "S");
    rec.add("GPS:GPSLongitude", "122.4194");
    rec.add("GPS:GPSLongitudeRef", "W");
    rec.add("GPS:GPSAltitude", "12.5");
    rec.add("GPS:GPSAltitudeRef", "1");
    rec.add("GPS:GPSImgDirection", "370");
    rec.add("GPS:GPSHPositioningError", "3.5");
    rec.add("IFD0:Make", " GoPro ");
    rec.add("IFD0:Model", "HERO9 Black");
    rec.add("IFD0:Orientation", "6");
    rec.add("File:ImageWidth", "4000");
    rec.add("File:ImageHeight", "3000");

    auto exif = telemetry::parse_image_exif(rec);
    REQUIRE(*exif.time == Approx(T0));
    REQUIRE(*exif.lat == Approx(-37.7749));
    REQUIRE(*exif.lon == Approx(-122.4194));
    REQUIRE(*exif.alt == Approx(-12.5));
    REQUIRE(*exif.angle == Approx(10.0));
    REQUIRE(*exif.gps_accuracy == Approx(3.5));
    REQUIRE(exif.make == "GoPro");
    REQUIRE(exif.model == "HERO9 Black");
    REQUIRE(*exif.orientation == 6);
    REQUIRE(exif.width == 4000);
    REQUIRE(exif.height == 3000);
}

TEST_CASE("image_exif_xmp_fallback_and_missing_fields") {
    io::MetadataRecord rec;
    rec.add("XMP-exif:GPSLatitude", "48.1");
    rec.add("XMP-exif:GPSLongitude", "11.5");
    rec.add("XMP-exif:GPSTrack", "-90");
    rec.add("IFD0:Orientation", "12");

    auto exif = telemetry::parse_image_exif(rec);
    REQUIRE(*exif.lat == Approx(48.1));
    REQUIRE(*exif.lon == Approx(11.5));
    REQUIRE(*exif.angle == Approx(270.0));
    REQUIRE_FALSE(exif.time.has_value());
    REQUIRE_FALSE(exif.alt.has_value());
    REQUIRE_FALSE(exif.orientation.has_value());
    REQUIRE(exif.make.empty());
    REQUIRE(exif.width == 0);
}

TEST_CASE("exiftool_video_quicktime_lists") {
    io::MetadataRecord rec;
    rec.add("GoPro:Model", "HERO11 Black");
    rec.add("QuickTime:GPSDateTime", "2023:01:02 10:30:01Z");
    rec.add("QuickTime:GPSLatitude", "37.7750");
    rec.add("QuickTime:GPSLongitude", "-122.4195");
    rec.add("QuickTime:GPSAltitude", "11.0");
    rec.add("QuickTime:GPSDateTime", "2023:01:02 10:30:00Z");
    rec.add("QuickTime:GPSLatitude", "37.7749");
    rec.add("QuickTime:GPSLongitude", "-122.4194");

    auto result = telemetry::parse_exiftool_video(rec);
    REQUIRE(result.make == "GoPro");
    REQUIRE(result.model == "HERO11 Black");
    REQUIRE(result.points.size() == 2);
    REQUIRE(result.points[0].time == Approx(T0));
    REQUIRE_FALSE(result.points[0].alt.has_value());
    REQUIRE(result.points[1].time == Approx(T0 + 1.0));
    REQUIRE(*result.points[1].alt == Approx(11.0));
}

TEST_CASE("exiftool_video_track_samples_anchor_on_creation_date") {
    io::MetadataRecord rec;
    rec.add("IFD0:Make", "Garmin");
    rec.add("QuickTime:CreateDate", "2023:01:02 10:30:00");
    rec.add("Track3:SampleTime", "0");
    rec.add("Track3:SampleDuration", "1");
    rec.add("Track3:GPSMeasureMode", "3");
    rec.add("Track3:GPSLatitude", "37.7749");
    rec.add("Track3:GPSLongitude", "-122.4194");
    rec.add("Track3:GPSLatitude", "37.7750");
    rec.add("Track3:GPSLongitude", "-122.4195");
    rec.add("Track3:SampleTime", "1");
    rec.add("Track3:SampleDuration", "1");
    rec.add("Track3:GPSLatitude", "37.7751");
    rec.add("Track3:GPSLongitude", "-122.4196");
    rec.add("Track3:GPSHPositioningError", "2.5");

    auto result = telemetry::parse_exiftool_video(rec);
    REQUIRE(result.make == "Garmin");
    REQUIRE(result.points.size() == 3);
    REQUIRE(result.points[0].time == Approx(T0));
    REQUIRE(result.points[1].time == Approx(T0 + 0.5));
    REQUIRE(result.points[2].time == Approx(T0 + 1.0));
    REQUIRE(*result.points[0].fix == GPSFix::FIX_3D);
    REQUIRE_FALSE(result.points[2].fix.has_value());
    REQUIRE(*result.points[2].precision == Approx(250.0));
}

TEST_CASE("exiftool_video_errors") {
    SECTION("track samples without creation date") {
        io::MetadataRecord rec;
        rec.add("QuickTime:CreateDate", "0000:00:00 00:00:00");
        rec.add("Track1:SampleTime", "0");
        rec.add("Track1:SampleDuration", "1");
        rec.add("Track1:GPSLatitude", "1.0");
        rec.add("Track1:GPSLongitude", "2.0");
        REQUIRE_THROWS_AS(telemetry::parse_exiftool_video(rec), ParseError);
    }
    SECTION("list lengths differ") {
        io::MetadataRecord rec;
        rec.add("QuickTime:GPSDateTime", "2023:01:02 10:30:00Z");
        rec.add("QuickTime:GPSLatitude", "1.0");
        rec.add("QuickTime:GPSLatitude", "1.1");
        rec.add("QuickTime:GPSLongitude", "2.0");
        REQUIRE_THROWS_AS(telemetry::parse_exiftool_video(rec), ParseError);
    }
    SECTION("no gps at all") {
        io::MetadataRecord rec;
        rec.add("IFD0:Make", "Sony");
        REQUIRE_THROWS_AS(telemetry::parse_exiftool_video(rec), ParseError);
    }
}
