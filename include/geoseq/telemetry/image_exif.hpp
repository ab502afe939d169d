#pragma once

#include "geoseq/io/metadata_record.hpp"

#include <optional>
#include <string>

namespace geoseq::telemetry {

// Geotag fields of one image as read from its EXIF/XMP metadata
struct ImageExif {
    std::optional<double> time;
    std::optional<double> lat;
    std::optional<double> lon;
    std::optional<double> alt;
    std::optional<double> angle;
    std::string make;
    std::string model;
    std::optional<int> orientation;
    std::optional<double> gps_accuracy;
    int width = 0;
    int height = 0;
};

ImageExif parse_image_exif(const io::MetadataRecord& record);

// Capture time: DateTimeOriginal, DateTimeDigitized, DateTime, then the GPS date and time stamps
std::optional<double> extract_capture_time(const io::MetadataRecord& record);

} // namespace geoseq::telemetry
