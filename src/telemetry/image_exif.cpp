#include "geoseq/telemetry/image_exif.hpp"
#include "geoseq/core/geo.hpp"
#include "geoseq/core/utils.hpp"

#include <cctype>
#include <cmath>

namespace geoseq::telemetry {

namespace {

std::optional<std::string> lookup(const io::MetadataRecord& record,
                                  std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto v = record.get(key)) {
            std::string text = core::trim(*v);
            if (!text.empty()) {
                return text;
            }
        }
    }
    return std::nullopt;
}

std::optional<double> lookup_double(const io::MetadataRecord& record,
                                    std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        if (auto v = record.get_double(key)) {
            return v;
        }
    }
    return std::nullopt;
}

// Applies a hemisphere reference ("N"/"S"/"E"/"W") to an unsigned coordinate
double apply_ref(double value, const std::optional<std::string>& ref) {
    if (ref && !ref->empty()) {
        const char c = static_cast<char>(std::toupper(static_cast<unsigned char>((*ref)[0])));
        if (c == 'S' || c == 'W') {
            return -std::fabs(value);
        }
        if (c == 'N' || c == 'E') {
            return std::fabs(value);
        }
    }
    return value;
}

// Combines a naive EXIF date with SubSecTime and OffsetTime tags
std::optional<double> combine_time(const std::string& date,
                                   const std::optional<std::string>& subsec,
                                   const std::optional<std::string>& offset) {
    std::string text = core::trim(date);
    if (text.size() > 19) {
        // already carries a fraction or a zone
        return core::parse_exif_datetime(text);
    }
    if (subsec) {
        std::string digits;
        for (char c : *subsec) {
            if (std::isdigit(static_cast<unsigned char>(c))) digits += c;
        }
        if (!digits.empty()) {
            text += "." + digits;
        }
    }
    if (offset && (offset->front() == '+' || offset->front() == '-')) {
        auto with_offset = core::parse_exif_datetime(text + *offset);
        if (with_offset) {
            return with_offset;
        }
    }
    return core::parse_exif_datetime(text);
}

// GPSDateStamp "YYYY:MM:DD" with GPSTimeStamp "hh:mm:ss[.fff]" (or space separated)
std::optional<double> gps_stamp_time(const io::MetadataRecord& record) {
    auto date = lookup(record, {"GPS:GPSDateStamp", "XMP-exif:GPSDateStamp"});
    auto time = lookup(record, {"GPS:GPSTimeStamp", "XMP-exif:GPSTimeStamp"});
    if (!date || !time) {
        return std::nullopt;
    }
    std::string t = *time;
    for (auto& c : t) {
        if (c == ' ') c = ':';
    }
    auto parts = core::split(t, ':');
    if (parts.size() != 3) {
        return std::nullopt;
    }
    auto h = core::parse_double(parts[0]);
    auto m = core::parse_double(parts[1]);
    auto s = core::parse_double(parts[2]);
    auto day = core::parse_exif_datetime(*date + " 00:00:00");
    if (!h || !m || !s || !day) {
        return std::nullopt;
    }
    return *day + *h * 3600.0 + *m * 60.0 + *s;
}

} // namespace

std::optional<double> extract_capture_time(const io::MetadataRecord& record) {
    struct Candidate {
        std::initializer_list<const char*> date;
        std::initializer_list<const char*> subsec;
        std::initializer_list<const char*> offset;
    };
    const Candidate candidates[] = {
        {{"ExifIFD:DateTimeOriginal", "XMP-exif:DateTimeOriginal"},
         {"ExifIFD:SubSecTimeOriginal"},
         {"ExifIFD:OffsetTimeOriginal"}},
        {{"ExifIFD:CreateDate", "ExifIFD:DateTimeDigitized", "XMP-exif:DateTimeDigitized"},
         {"ExifIFD:SubSecTimeDigitized"},
         {"ExifIFD:OffsetTimeDigitized"}},
        {{"IFD0:ModifyDate", "IFD0:DateTime"},
         {"ExifIFD:SubSecTime"},
         {"ExifIFD:OffsetTime"}},
    };
    for (const auto& c : candidates) {
        if (auto date = lookup(record, c.date)) {
            if (auto t = combine_time(*date, lookup(record, c.subsec), lookup(record, c.offset))) {
                return t;
            }
        }
    }
    return gps_stamp_time(record);
}

ImageExif parse_image_exif(const io::MetadataRecord& record) {
    ImageExif exif;
    exif.time = extract_capture_time(record);

    auto lat = lookup_double(record, {"GPS:GPSLatitude", "XMP-exif:GPSLatitude"});
    auto lon = lookup_double(record, {"GPS:GPSLongitude", "XMP-exif:GPSLongitude"});
    if (lat && lon) {
        exif.lat = apply_ref(*lat, lookup(record, {"GPS:GPSLatitudeRef", "XMP-exif:GPSLatitudeRef"}));
        exif.lon = apply_ref(*lon, lookup(record, {"GPS:GPSLongitudeRef", "XMP-exif:GPSLongitudeRef"}));
    }

    if (auto alt = lookup_double(record, {"GPS:GPSAltitude", "XMP-exif:GPSAltitude"})) {
        auto ref = lookup_double(record, {"GPS:GPSAltitudeRef", "XMP-exif:GPSAltitudeRef"});
        exif.alt = (ref && *ref == 1.0) ? -std::fabs(*alt) : *alt;
    }

    if (auto dir = lookup_double(record, {"GPS:GPSImgDirection", "XMP-exif:GPSImgDirection",
                                          "GPS:GPSTrack", "XMP-exif:GPSTrack"})) {
        exif.angle = core::normalize_bearing(*dir);
    }

    exif.make = lookup(record, {"IFD0:Make", "XMP-tiff:Make"}).value_or("");
    exif.model = lookup(record, {"IFD0:Model", "XMP-tiff:Model"}).value_or("");

    if (auto o = lookup_double(record, {"IFD0:Orientation", "XMP-tiff:Orientation"})) {
        const int v = static_cast<int>(*o);
        if (v >= 1 && v <= 8) {
            exif.orientation = v;
        }
    }
    exif.gps_accuracy = lookup_double(record, {"GPS:GPSHPositioningError", "XMP-exif:GPSHPositioningError"});

    auto w = lookup_double(record, {"File:ImageWidth", "ExifIFD:ExifImageWidth", "IFD0:ImageWidth"});
    auto h = lookup_double(record, {"File:ImageHeight", "ExifIFD:ExifImageHeight", "IFD0:ImageHeight"});
    auto dimension = [](const std::optional<double>& v) {
        return v && std::isfinite(*v) && *v > 0.0 && *v < 1e9 ? static_cast<int>(*v) : 0;
    };
    exif.width = dimension(w);
    exif.height = dimension(h);
    return exif;
}

} // namespace geoseq::telemetry
