#pragma once

#include "geoseq/io/mp4_reader.hpp"
#include "geoseq/telemetry/telemetry.hpp"

#include <optional>
#include <utility>

namespace geoseq::telemetry {

enum class CammType : uint16_t {
    ANGLE_AXIS = 0,
    EXPOSURE_TIME = 1,
    GYRO = 2,
    ACCELERATION = 3,
    POSITION = 4,
    MIN_GPS = 5,
    GPS = 6,
    MAGNETIC_FIELD = 7
};

// Decodes one camm sample payload. Non-GPS sample types yield nullopt.
std::optional<GPSPoint> parse_camm_sample(const uint8_t* data, size_t size);

// Make and model from moov/udta metadata atoms
std::pair<std::string, std::string> extract_camm_make_model(io::Mp4Reader& reader);

// GPS track of the first camm track. Throws ParseError when there is none.
TelemetryResult parse_camm(io::Mp4Reader& reader);

} // namespace geoseq::telemetry
